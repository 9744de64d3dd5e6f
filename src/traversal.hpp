#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "models.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "sharepoint_service.hpp"

#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace spo_sweep {

/// Drives the sweep: sites -> lists -> items.
///
/// Every remote call goes through the RetryPolicy, and the RateLimiter is
/// applied between consecutive sites, lists and items.  Failures are
/// absorbed at the innermost loop that encloses them (item, then list,
/// then site), logged and counted; run() itself never throws for a remote
/// failure.
class TraversalController {
public:
    struct Stats {
        int  sitesTotal       = 0;
        int  sitesProcessed   = 0;
        int  sitesFailed      = 0;
        int  listsProcessed   = 0;
        int  listsFailed      = 0;
        int  itemsInspected   = 0;
        int  itemsFailed      = 0;
        int  qualifyingFound  = 0;   // lists (label-reset) or items (record-unlock)
        int  itemsActedOn     = 0;   // lists relabelled or items unlocked
        int  partialMutations = 0;
        bool cancelled        = false;
    };

    TraversalController(SharePointService& service,
                        RetryPolicy& retry,
                        RateLimiter& pacer,
                        Logger& log,
                        Config config);

    /// Sweep @p sites in the given order.
    void run(const std::vector<std::string>& sites);

    /// Flag polled at every site / list / item boundary.  A set flag ends
    /// the run before the next unit starts; calls in flight complete.
    void setCancellationFlag(const std::atomic<bool>* flag) { mCancel = flag; }

    Stats getStats() const { return mStats; }

    /// True if anything was skipped because of an error.
    bool hadFailures() const;

private:
    SharePointService& mService;
    RetryPolicy&       mRetry;
    RateLimiter&       mPacer;
    Logger&            mLog;
    const Config       mConfig;
    const std::atomic<bool>* mCancel = nullptr;
    Stats              mStats{};

    void processSite(const std::string& siteUrl);
    void processList(const Session& session, const ListInfo& list);
    void processLabelList(const Session& session, const ListInfo& list);
    void processRecordList(const Session& session, const ListInfo& list);
    void processItem(const Session& session, const ListInfo& list, const ListItem& item);

    bool stopRequested();

    template <typename Operation>
    auto withRetry(Operation&& operation, const std::string& description)
        -> decltype(operation())
    {
        return mRetry.execute(std::forward<Operation>(operation),
                              mConfig.maxAttempts,
                              mConfig.baseDelay,
                              description);
    }
};

} // namespace spo_sweep
