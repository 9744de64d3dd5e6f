#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace spo_sweep {

/// Remote capabilities the sweep consumes.  Every call may throw
/// RemoteError (status code + optional Retry-After); callers wrap each
/// call in a RetryPolicy.
class SharePointService {
public:
    virtual ~SharePointService() = default;

    virtual Session connect(const std::string& siteUrl,
                            const Credentials& credentials) = 0;
    virtual void disconnect(const Session& session) = 0;

    /// All lists of the site's root web, in server order.
    virtual std::vector<ListInfo> listLists(const Session& session) = 0;

    /// Retention label currently set on @p list, nullopt if none.
    virtual std::optional<ComplianceLabel> getLabel(const Session& session,
                                                    const ListInfo& list) = 0;
    virtual void resetLabel(const Session& session, const ListInfo& list) = 0;
    virtual void applyLabel(const Session& session,
                            const ListInfo& list,
                            const std::string& labelName) = 0;

    /// One page of @p list's items.  An empty @p nextLink asks for the
    /// first page; otherwise it is the nextLink of the previous page.
    virtual ItemsPage listItemsPage(const Session& session,
                                    const ListInfo& list,
                                    const std::string& nextLink) = 0;

    /// Every item of @p list, pages concatenated in retrieval order.
    std::vector<ListItem> listItems(const Session& session, const ListInfo& list) {
        std::vector<ListItem> items;
        std::string next;
        do {
            auto page = listItemsPage(session, list, next);
            items.insert(items.end(), page.items.begin(), page.items.end());
            next = page.nextLink.value_or("");
        } while (!next.empty());
        return items;
    }

    /// @return false if the service accepted the call but reported that
    ///         the record could not be unlocked.
    virtual bool unlockItem(const Session& session,
                            const ListInfo& list,
                            int itemId) = 0;
};

} // namespace spo_sweep
