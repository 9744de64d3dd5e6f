#pragma once

#include "sharepoint_service.hpp"
#include "util.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace spo_sweep {

/// SharePoint Online REST client built on Boost.Beast.
/// Each call opens its own connection, sends one request and turns any
/// non-2xx answer into a RemoteError carrying the status and Retry-After.
class SharePointClient : public SharePointService {
public:
    struct Response {
        unsigned int httpStatus = 0;
        nlohmann::json body;
        std::optional<std::chrono::seconds> retryAfter;
    };

    /// @param timeoutMs  Per-operation timeout in milliseconds
    /// @param pageSize   $top used when paging list items
    explicit SharePointClient(int timeoutMs = 30000, int pageSize = 500);

    Session connect(const std::string& siteUrl,
                    const Credentials& credentials) override;
    void disconnect(const Session& session) override;

    std::vector<ListInfo> listLists(const Session& session) override;

    std::optional<ComplianceLabel> getLabel(const Session& session,
                                            const ListInfo& list) override;
    void resetLabel(const Session& session, const ListInfo& list) override;
    void applyLabel(const Session& session,
                    const ListInfo& list,
                    const std::string& labelName) override;

    ItemsPage listItemsPage(const Session& session,
                            const ListInfo& list,
                            const std::string& nextLink) override;
    bool unlockItem(const Session& session,
                    const ListInfo& list,
                    int itemId) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    int         mTimeoutMs;
    int         mPageSize;
    bool        mVerbose = false;

    /// Send a request and throw RemoteError unless the status is 2xx.
    Response call(const Session& session,
                  const std::string& method,
                  const std::string& target,
                  const nlohmann::json& payload = nullptr);

    /// Raw exchange.  Transport failures surface as RemoteError(0, ...).
    Response send(const UrlParts& endpoint,
                  const std::string& accessToken,
                  const std::string& method,
                  const std::string& requestBody);

    Response doHttpRequest(const UrlParts& endpoint,
                           const std::string& accessToken,
                           const std::string& method,
                           const std::string& requestBody);
    Response doHttpsRequest(const UrlParts& endpoint,
                            const std::string& accessToken,
                            const std::string& method,
                            const std::string& requestBody);

    void setComplianceTag(const Session& session,
                          const ListInfo& list,
                          const std::string& tagName);

    static std::string apiRoot(const Session& session);
};

} // namespace spo_sweep
