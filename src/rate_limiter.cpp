#include "rate_limiter.hpp"

#include <utility>

namespace spo_sweep {

RateLimiter::RateLimiter(Logger& log, SleepFn sleep)
    : mLog(log)
    , mSleep(std::move(sleep)) {}

void RateLimiter::pace(std::chrono::milliseconds duration,
                       const std::string& description)
{
    if (duration.count() <= 0) return;

    mLog.verbose("[Pace] " + description + ": sleeping " +
                 std::to_string(duration.count()) + " ms");

    mTotalPause += duration;
    ++mPauseCount;
    mSleep(duration);
}

double RateLimiter::totalPauseSeconds() const {
    return std::chrono::duration<double>(mTotalPause).count();
}

} // namespace spo_sweep
