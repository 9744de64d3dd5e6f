#pragma once

#include "logger.hpp"
#include "util.hpp"

#include <chrono>
#include <string>

namespace spo_sweep {

/// Fixed pauses applied between consecutive operations at each level.
struct PacingConfig {
    std::chrono::milliseconds betweenItems{0};
    std::chrono::milliseconds betweenLists{0};
    std::chrono::milliseconds betweenSites{0};
};

/// Proactive pacing so a sweep stays under the tenant's request budget
/// instead of relying on 429s alone.
class RateLimiter {
public:
    explicit RateLimiter(Logger& log, SleepFn sleep = sleepFor);

    /// Suspend for @p duration.  A zero (or negative) duration returns
    /// at once without logging.
    void pace(std::chrono::milliseconds duration, const std::string& description);

    // ---- accessors for summary report ----
    double totalPauseSeconds() const;
    int    totalPauses()       const { return mPauseCount; }

private:
    Logger&                   mLog;
    SleepFn                   mSleep;
    std::chrono::milliseconds mTotalPause{0};
    int                       mPauseCount = 0;
};

} // namespace spo_sweep
