#pragma once

#include <optional>
#include <string>
#include <vector>

namespace spo_sweep {

/// Opaque credentials handed to the connection capability.
struct Credentials {
    std::string accessToken;   // OAuth bearer token for the tenant
};

/// An open connection to one site.  Owned by the traversal controller,
/// one at a time.
struct Session {
    std::string siteUrl;       // e.g. "https://contoso.sharepoint.com/sites/hr"
    std::string scheme;
    std::string host;
    std::string port;
    std::string webPath;       // server-relative path of the web ("/sites/hr")
    std::string title;         // web title reported at connect time
    std::string accessToken;
};

/// Mirrors an SP.List (subset of fields used while sweeping).
struct ListInfo {
    std::string title;
    bool        hidden    = false;
    int         itemCount = 0;
    std::string url;           // server-relative root folder URL
};

/// Mirrors an SP.ListItem (subset).
struct ListItem {
    int                id = 0;
    std::string        displayName;      // FileLeafRef, falls back to Title
    std::optional<int> complianceFlag;   // _ComplianceFlags, absent if null
};

/// Retention label currently applied to a list.
struct ComplianceLabel {
    std::string name;
};

/// One page of a list's items.
struct ItemsPage {
    std::vector<ListItem>      items;
    std::optional<std::string> nextLink;   // absolute URL of the next page
};

} // namespace spo_sweep
