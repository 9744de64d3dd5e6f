#include "traversal.hpp"
#include "compliance.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <exception>
#include <utility>

namespace spo_sweep {

namespace {

/// Releases the site connection on every exit path.
class SessionGuard {
public:
    SessionGuard(SharePointService& service, const Session& session, Logger& log)
        : mService(service), mSession(session), mLog(log) {}

    ~SessionGuard() {
        try {
            mService.disconnect(mSession);
        } catch (const std::exception& e) {
            mLog.warn("[Sweep] Failed to disconnect from " + mSession.siteUrl +
                      ": " + e.what());
        } catch (...) {
            mLog.warn("[Sweep] Failed to disconnect from " + mSession.siteUrl +
                      ": unknown error");
        }
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

private:
    SharePointService& mService;
    const Session&     mSession;
    Logger&            mLog;
};

std::string quoted(const std::string& s) {
    return "'" + s + "'";
}

} // namespace

TraversalController::TraversalController(SharePointService& service,
                                         RetryPolicy& retry,
                                         RateLimiter& pacer,
                                         Logger& log,
                                         Config config)
    : mService(service)
    , mRetry(retry)
    , mPacer(pacer)
    , mLog(log)
    , mConfig(std::move(config)) {}

// ---------------------------------------------------------------------------
// Public: sweep
// ---------------------------------------------------------------------------

void TraversalController::run(const std::vector<std::string>& sites) {
    mStats.sitesTotal += static_cast<int>(sites.size());

    for (std::size_t i = 0; i < sites.size(); ++i) {
        if (stopRequested()) break;

        mLog.info("[Sweep] Site " + std::to_string(i + 1) + "/" +
                  std::to_string(sites.size()) + ": " + sites[i]);
        processSite(sites[i]);

        if (i + 1 < sites.size() && !stopRequested()) {
            mPacer.pace(mConfig.pacing.betweenSites, "between sites");
        }
    }
}

bool TraversalController::hadFailures() const {
    return mStats.sitesFailed > 0 || mStats.listsFailed > 0 ||
           mStats.itemsFailed > 0 || mStats.partialMutations > 0;
}

// ---------------------------------------------------------------------------
// Private: per level
// ---------------------------------------------------------------------------

void TraversalController::processSite(const std::string& siteUrl) {
    const Credentials credentials{mConfig.accessToken};

    Session session;
    try {
        session = withRetry([&] { return mService.connect(siteUrl, credentials); },
                            "Connect to " + siteUrl);
    } catch (const std::exception& e) {
        ++mStats.sitesFailed;
        mLog.error("[Sweep] Cannot connect to " + siteUrl + ", skipping site: " +
                   e.what());
        return;
    }

    SessionGuard guard(mService, session, mLog);

    // Filtered once; the snapshot is what gets swept.
    std::vector<ListInfo> lists;
    try {
        const auto all = withRetry([&] { return mService.listLists(session); },
                                   "Enumerate lists of " + siteUrl);
        lists = selectListsForSweep(all, mConfig.ignoreLists);
        mLog.verbose("[Sweep] " + std::to_string(lists.size()) + " of " +
                     std::to_string(all.size()) + " lists selected on " + siteUrl);
    } catch (const std::exception& e) {
        ++mStats.sitesFailed;
        mLog.error("[Sweep] Cannot enumerate lists of " + siteUrl +
                   ", skipping site: " + e.what());
        return;
    }
    ++mStats.sitesProcessed;

    for (std::size_t i = 0; i < lists.size(); ++i) {
        if (stopRequested()) return;

        processList(session, lists[i]);

        if (i + 1 < lists.size() && !stopRequested()) {
            mPacer.pace(mConfig.pacing.betweenLists, "between lists");
        }
    }
}

void TraversalController::processList(const Session& session, const ListInfo& list) {
    try {
        if (mConfig.mode == SweepMode::LabelReset) {
            processLabelList(session, list);
        } else {
            processRecordList(session, list);
        }
    } catch (const PartialMutationError& e) {
        ++mStats.partialMutations;
        ++mStats.listsFailed;
        mLog.error("[Label] PARTIAL CHANGE on " + session.siteUrl + " list " +
                   quoted(list.title) + ": " + e.what() +
                   ".  The list has no label now; reapply " +
                   quoted(e.labelName()) + " manually.");
    } catch (const std::exception& e) {
        ++mStats.listsFailed;
        mLog.error("[Sweep] List " + quoted(list.title) + " on " +
                   session.siteUrl + " skipped: " + e.what());
    }
}

void TraversalController::processLabelList(const Session& session, const ListInfo& list) {
    const auto label = withRetry(
        [&] { return mService.getLabel(session, list); },
        "Get label of " + quoted(list.title));

    if (!label) {
        mLog.info("[Label] " + quoted(list.title) + ": no label set - skip");
        ++mStats.listsProcessed;
        return;
    }

    if (!labelQualifies(label, mConfig.targetLabel)) {
        mLog.info("[Label] " + quoted(list.title) + ": label " +
                  quoted(label->name) + " does not match " +
                  quoted(mConfig.targetLabel) + " - skip");
        ++mStats.listsProcessed;
        return;
    }

    ++mStats.qualifyingFound;

    if (mConfig.reportOnly) {
        mLog.info("[Label] " + quoted(list.title) + ": label " +
                  quoted(label->name) + " found (report only)");
        ++mStats.listsProcessed;
        return;
    }

    withRetry([&] { mService.resetLabel(session, list); },
              "Reset label of " + quoted(list.title));

    try {
        withRetry([&] { mService.applyLabel(session, list, label->name); },
                  "Reapply label " + quoted(label->name) + " to " +
                  quoted(list.title));
    } catch (const std::exception& e) {
        throw PartialMutationError(list.title, label->name, e.what());
    }

    ++mStats.itemsActedOn;
    ++mStats.listsProcessed;
    mLog.info("[Label] " + quoted(list.title) + ": label " +
              quoted(label->name) + " reset and reapplied");
}

void TraversalController::processRecordList(const Session& session, const ListInfo& list) {
    // Each page is retried on its own so a throttled page does not refetch
    // the ones before it.
    std::vector<ListItem> items;
    std::string next;
    int pageNo = 0;
    do {
        ++pageNo;
        auto page = withRetry(
            [&] { return mService.listItemsPage(session, list, next); },
            "List items of " + quoted(list.title) + " (page " +
                std::to_string(pageNo) + ")");
        items.insert(items.end(), page.items.begin(), page.items.end());
        next = page.nextLink.value_or("");
    } while (!next.empty());

    mLog.verbose("[Record] " + quoted(list.title) + ": " +
                 std::to_string(items.size()) + " items");

    for (std::size_t i = 0; i < items.size(); ++i) {
        if (stopRequested()) return;

        try {
            processItem(session, list, items[i]);
        } catch (const std::exception& e) {
            ++mStats.itemsFailed;
            mLog.error("[Record] " + quoted(list.title) + " item " +
                       std::to_string(items[i].id) + " skipped: " + e.what());
        }

        if (i + 1 < items.size() && !stopRequested()) {
            mPacer.pace(mConfig.pacing.betweenItems, "between items");
        }
    }

    ++mStats.listsProcessed;
}

void TraversalController::processItem(const Session& session,
                                      const ListInfo& list,
                                      const ListItem& item)
{
    ++mStats.itemsInspected;

    const std::string name = quoted(list.title) + " item " +
                             std::to_string(item.id) + " " +
                             quoted(item.displayName);

    switch (classifyComplianceFlag(item.complianceFlag)) {
        case LockState::NotLocked:
            mLog.verbose("[Record] " + name + ": not locked");
            return;
        case LockState::Unknown:
            mLog.warn("[Record] " + name + ": unknown flag " +
                      std::to_string(*item.complianceFlag) + " - skip");
            return;
        case LockState::Locked:
            break;
    }

    ++mStats.qualifyingFound;

    if (mConfig.reportOnly) {
        mLog.info("[Record] " + name + ": locked record (report only)");
        return;
    }

    const bool unlocked = withRetry(
        [&] { return mService.unlockItem(session, list, item.id); },
        "Unlock " + name);

    if (!unlocked) {
        ++mStats.itemsFailed;
        mLog.warn("[Record] " + name + ": unlock was refused by the service");
        return;
    }

    ++mStats.itemsActedOn;
    mLog.info("[Record] " + name + ": unlocked");
}

bool TraversalController::stopRequested() {
    if (mCancel == nullptr || !mCancel->load()) return false;

    if (!mStats.cancelled) {
        mStats.cancelled = true;
        mLog.warn("[Sweep] Cancellation requested; stopping");
    }
    return true;
}

} // namespace spo_sweep
