#include "retry_policy.hpp"

#include <sstream>
#include <utility>

namespace spo_sweep {

FailureKind classifyFailure(const RemoteError& error) {
    return error.isThrottled() ? FailureKind::Throttled
                               : FailureKind::NonRetryable;
}

RetryPolicy::RetryPolicy(Logger& log, SleepFn sleep)
    : mLog(log)
    , mSleep(std::move(sleep)) {}

void RetryPolicy::waitBeforeRetry(const RemoteError& error,
                                  int attempt,
                                  int maxAttempts,
                                  std::chrono::milliseconds baseDelay,
                                  const std::string& description)
{
    if (attempt >= maxAttempts) {
        ++mStats.totalExhausted;

        std::ostringstream msg;
        msg << "[Retry] " << description << ": HTTP " << error.statusCode()
            << " on attempt " << attempt << "/" << maxAttempts
            << ", max retries exceeded";
        mLog.error(msg.str());

        throw RetryExhaustedError(description, attempt, error.statusCode());
    }

    const auto delay = computeRetryDelay(attempt, baseDelay, error.retryAfter());

    std::ostringstream msg;
    msg << "[Retry] " << description << ": throttled (HTTP "
        << error.statusCode() << ") on attempt " << attempt << "/"
        << maxAttempts << ", waiting " << delay.count() << " ms";
    if (error.retryAfter()) {
        msg << " (Retry-After)";
    }
    mLog.warn(msg.str());

    ++mStats.totalRetries;
    mStats.totalWait += delay;
    mSleep(delay);
}

} // namespace spo_sweep
