#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spo_sweep {

/// Parse the body of GET _api/web/lists (odata=nometadata).
/// Throws std::runtime_error if the expected shape is missing.
std::vector<ListInfo> parseListsResponse(const nlohmann::json& responseBody);

/// Map a single list JSON object into a ListInfo.
ListInfo parseListNode(const nlohmann::json& node);

/// Keep visible, non-empty lists whose title is not in @p ignoreTitles.
/// Enumeration order is preserved.
std::vector<ListInfo> selectListsForSweep(const std::vector<ListInfo>& lists,
                                          const std::set<std::string>& ignoreTitles);

/// Parse one page of GET _api/web/lists/GetByTitle(...)/items.
ItemsPage parseItemsPage(const nlohmann::json& responseBody);

/// Map a single item JSON object into a ListItem.
ListItem parseItemNode(const nlohmann::json& node);

/// Parse a GetListComplianceTag response.  Empty or null tag => nullopt.
std::optional<ComplianceLabel> parseComplianceTag(const nlohmann::json& responseBody);

/// Read a bare boolean result ({"value": true}).  Missing => @p fallback.
bool parseBooleanResult(const nlohmann::json& responseBody, bool fallback);

/// Pull the human-readable message from an OData error body (may be empty).
std::string extractODataError(const nlohmann::json& responseBody);

} // namespace spo_sweep
