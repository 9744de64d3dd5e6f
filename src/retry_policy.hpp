#pragma once

#include "errors.hpp"
#include "logger.hpp"
#include "util.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace spo_sweep {

enum class FailureKind { Throttled, NonRetryable };

/// Throttled for 429 / 503, NonRetryable for everything else.
FailureKind classifyFailure(const RemoteError& error);

/// Runs one remote operation under a throttling-aware retry schedule.
///
/// The operation is any nullary callable.  A RemoteError classified as
/// Throttled is retried after a wait (server Retry-After, or exponential
/// backoff from baseDelay); any other failure propagates on the spot.
/// When the attempts run out RetryExhaustedError is thrown.
class RetryPolicy {
public:
    struct Stats {
        int                       totalRetries   = 0;
        int                       totalExhausted = 0;
        std::chrono::milliseconds totalWait{0};
    };

    explicit RetryPolicy(Logger& log, SleepFn sleep = sleepFor);

    template <typename Operation>
    auto execute(Operation&& operation,
                 int maxAttempts,
                 std::chrono::milliseconds baseDelay,
                 const std::string& description) -> decltype(operation())
    {
        if (maxAttempts < 1) {
            throw std::invalid_argument("maxAttempts must be >= 1");
        }

        for (int attempt = 1;; ++attempt) {
            try {
                return operation();
            } catch (const RemoteError& e) {
                if (classifyFailure(e) != FailureKind::Throttled) {
                    throw;
                }
                waitBeforeRetry(e, attempt, maxAttempts, baseDelay, description);
            }
        }
    }

    Stats getStats() const { return mStats; }

private:
    Logger& mLog;
    SleepFn mSleep;
    Stats   mStats{};

    /// Sleeps for the computed delay, or throws RetryExhaustedError when
    /// @p attempt was the last one.
    void waitBeforeRetry(const RemoteError& error,
                         int attempt,
                         int maxAttempts,
                         std::chrono::milliseconds baseDelay,
                         const std::string& description);
};

} // namespace spo_sweep
