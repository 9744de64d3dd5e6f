/// @file test_retry_policy.cpp
/// Unit tests for retry_policy.hpp — throttling-aware retry wrapper.

#include "retry_policy.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace spo_sweep;
using namespace spo_sweep::testing_support;
using std::chrono::milliseconds;
using std::chrono::seconds;

// ---------------------------------------------------------------------------
// Fixture: logger with an in-memory sink, sleeps recorded instead of taken
// ---------------------------------------------------------------------------

class RetryPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink = std::make_shared<RecordingSink>();
        log.addSink(sink);
    }

    RetryPolicy makePolicy() { return RetryPolicy(log, sleeper.fn()); }

    Logger                         log;
    std::shared_ptr<RecordingSink> sink;
    SleepRecorder                  sleeper;
};

// ============================================================================
// Classification
// ============================================================================

TEST(ClassifyFailure, TooManyRequestsAndServiceUnavailableAreThrottled) {
    EXPECT_EQ(classifyFailure(RemoteError(429, "x")), FailureKind::Throttled);
    EXPECT_EQ(classifyFailure(RemoteError(503, "x")), FailureKind::Throttled);
}

TEST(ClassifyFailure, OtherStatusesAreNonRetryable) {
    EXPECT_EQ(classifyFailure(RemoteError(0, "x")),   FailureKind::NonRetryable);
    EXPECT_EQ(classifyFailure(RemoteError(400, "x")), FailureKind::NonRetryable);
    EXPECT_EQ(classifyFailure(RemoteError(403, "x")), FailureKind::NonRetryable);
    EXPECT_EQ(classifyFailure(RemoteError(404, "x")), FailureKind::NonRetryable);
    EXPECT_EQ(classifyFailure(RemoteError(500, "x")), FailureKind::NonRetryable);
}

// ============================================================================
// Success paths
// ============================================================================

TEST_F(RetryPolicyTest, FirstAttemptSuccessDoesNotWait) {
    auto policy = makePolicy();
    int calls = 0;

    int result = policy.execute([&] { ++calls; return 42; },
                                3, milliseconds(5000), "answer");

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeper.waits.empty());
    EXPECT_EQ(sink->count(LogLevel::Warning), 0);
}

TEST_F(RetryPolicyTest, TwoThrottlesThenSuccessWaitsTwice) {
    auto policy = makePolicy();
    int calls = 0;

    std::string result = policy.execute(
        [&]() -> std::string {
            if (++calls <= 2) throw RemoteError(429, "Too Many Requests");
            return "connected";
        },
        3, milliseconds(5000), "Connect to site");

    EXPECT_EQ(result, "connected");
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(sleeper.waits.size(), 2u);
    EXPECT_EQ(policy.getStats().totalRetries, 2);
    EXPECT_EQ(sink->count(LogLevel::Warning), 2);
    EXPECT_TRUE(sink->contains(LogLevel::Warning, "Connect to site"));
    EXPECT_TRUE(sink->contains(LogLevel::Warning, "429"));
}

TEST_F(RetryPolicyTest, VoidOperationIsSupported) {
    auto policy = makePolicy();
    int calls = 0;

    policy.execute([&] { if (++calls == 1) throw RemoteError(503, "busy"); },
                   2, milliseconds(100), "reset label");

    EXPECT_EQ(calls, 2);
    ASSERT_EQ(sleeper.waits.size(), 1u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(100));
}

// ============================================================================
// Fail-fast paths
// ============================================================================

TEST_F(RetryPolicyTest, NonRetryableFailsAfterOneAttempt) {
    auto policy = makePolicy();
    int calls = 0;

    try {
        policy.execute([&]() -> int { ++calls; throw RemoteError(403, "Access denied"); },
                       5, milliseconds(5000), "List items");
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.statusCode(), 403u);
    }

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeper.waits.empty());
    EXPECT_EQ(policy.getStats().totalRetries, 0);
}

TEST_F(RetryPolicyTest, NonRemoteExceptionPropagatesWithoutRetry) {
    auto policy = makePolicy();
    int calls = 0;

    EXPECT_THROW(
        policy.execute([&]() -> int { ++calls; throw std::invalid_argument("bad url"); },
                       5, milliseconds(5000), "Connect"),
        std::invalid_argument);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeper.waits.empty());
}

TEST_F(RetryPolicyTest, ZeroAttemptsIsRejected) {
    auto policy = makePolicy();
    EXPECT_THROW(policy.execute([] { return 1; }, 0, milliseconds(1), "noop"),
                 std::invalid_argument);
}

// ============================================================================
// Backoff schedule
// ============================================================================

TEST_F(RetryPolicyTest, ExponentialBackoffDoublesFromBaseDelay) {
    auto policy = makePolicy();
    int calls = 0;

    EXPECT_THROW(
        policy.execute([&]() -> int { ++calls; throw RemoteError(429, "throttled"); },
                       4, milliseconds(5000), "Get label"),
        RetryExhaustedError);

    EXPECT_EQ(calls, 4);
    ASSERT_EQ(sleeper.waits.size(), 3u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(5000));
    EXPECT_EQ(sleeper.waits[1], milliseconds(10000));
    EXPECT_EQ(sleeper.waits[2], milliseconds(20000));
}

TEST_F(RetryPolicyTest, RetryAfterIsUsedVerbatimOnEveryAttempt) {
    auto policy = makePolicy();
    int calls = 0;

    int result = policy.execute(
        [&]() -> int {
            if (++calls <= 3) throw RemoteError(503, "busy", seconds(7));
            return 1;
        },
        5, milliseconds(5000), "Unlock item");

    EXPECT_EQ(result, 1);
    ASSERT_EQ(sleeper.waits.size(), 3u);
    for (const auto& w : sleeper.waits) {
        EXPECT_EQ(w, milliseconds(7000));
    }
}

TEST_F(RetryPolicyTest, RetryAfterOnlyAppliesToTheFailureThatCarriedIt) {
    auto policy = makePolicy();
    int calls = 0;

    policy.execute(
        [&]() -> int {
            ++calls;
            if (calls == 1) throw RemoteError(429, "throttled", seconds(3));
            if (calls == 2) throw RemoteError(429, "throttled");
            return 0;
        },
        3, milliseconds(1000), "List lists");

    ASSERT_EQ(sleeper.waits.size(), 2u);
    EXPECT_EQ(sleeper.waits[0], milliseconds(3000));
    EXPECT_EQ(sleeper.waits[1], milliseconds(2000));   // 1000 * 2^(2-1)
    EXPECT_EQ(policy.getStats().totalWait, milliseconds(5000));
}

// ============================================================================
// Exhaustion
// ============================================================================

TEST_F(RetryPolicyTest, ExhaustionThrowsTerminalErrorAndLogsError) {
    auto policy = makePolicy();

    try {
        policy.execute([]() -> int { throw RemoteError(429, "throttled"); },
                       3, milliseconds(10), "Reset label");
        FAIL() << "expected RetryExhaustedError";
    } catch (const RetryExhaustedError& e) {
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_EQ(e.lastStatus(), 429u);
        EXPECT_EQ(e.description(), "Reset label");
        EXPECT_NE(std::string(e.what()).find("Max retries exceeded"), std::string::npos);
    }

    EXPECT_EQ(sleeper.waits.size(), 2u);
    EXPECT_EQ(sink->count(LogLevel::Warning), 2);
    EXPECT_EQ(sink->count(LogLevel::Error), 1);
    EXPECT_EQ(policy.getStats().totalExhausted, 1);
}

TEST_F(RetryPolicyTest, SingleAttemptNeverWaits) {
    auto policy = makePolicy();

    EXPECT_THROW(
        policy.execute([]() -> int { throw RemoteError(503, "busy"); },
                       1, milliseconds(5000), "Connect"),
        RetryExhaustedError);

    EXPECT_TRUE(sleeper.waits.empty());
}

TEST_F(RetryPolicyTest, NonRetryableAfterThrottleStopsImmediately) {
    auto policy = makePolicy();
    int calls = 0;

    EXPECT_THROW(
        policy.execute(
            [&]() -> int {
                if (++calls == 1) throw RemoteError(429, "throttled");
                throw RemoteError(404, "List does not exist");
            },
            5, milliseconds(10), "Get label"),
        RemoteError);

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(sleeper.waits.size(), 1u);
}
