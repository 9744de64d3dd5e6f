#include "mapping.hpp"

#include <limits>
#include <stdexcept>

namespace spo_sweep {

namespace {

std::optional<int> optionalInt(const nlohmann::json& node, const char* key) {
    if (!node.contains(key)) return std::nullopt;

    const auto& v = node[key];
    if (v.is_number_unsigned()) {
        const auto n = v.get<unsigned long long>();
        if (n > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    if (v.is_number_integer()) {
        const auto n = v.get<long long>();
        if (n < std::numeric_limits<int>::min() ||
            n > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    if (v.is_number()) {
        const auto d = v.get<double>();
        if (!(d >= std::numeric_limits<int>::min() &&
              d <= std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(d);
    }
    if (v.is_string()) {
        // Some farms serialize _ComplianceFlags as a string.
        const auto s = v.get<std::string>();
        if (s.empty()) return std::nullopt;
        try {
            return std::stoi(s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

ListInfo parseListNode(const nlohmann::json& node) {
    ListInfo list;
    list.title     = node.value("Title", "");
    list.hidden    = node.value("Hidden", false);
    list.itemCount = node.value("ItemCount", 0);

    if (node.contains("RootFolder") && node["RootFolder"].is_object()) {
        list.url = node["RootFolder"].value("ServerRelativeUrl", "");
    }
    return list;
}

std::vector<ListInfo> parseListsResponse(const nlohmann::json& responseBody) {
    if (!responseBody.contains("value") || !responseBody["value"].is_array()) {
        throw std::runtime_error("Response missing 'value' array of lists");
    }

    std::vector<ListInfo> lists;
    for (const auto& node : responseBody["value"]) {
        lists.push_back(parseListNode(node));
    }
    return lists;
}

std::vector<ListInfo> selectListsForSweep(const std::vector<ListInfo>& lists,
                                          const std::set<std::string>& ignoreTitles) {
    std::vector<ListInfo> selected;
    for (const auto& list : lists) {
        if (list.hidden || list.itemCount <= 0) continue;
        if (ignoreTitles.count(list.title) != 0) continue;
        selected.push_back(list);
    }
    return selected;
}

ListItem parseItemNode(const nlohmann::json& node) {
    ListItem item;
    item.id = node.value("Id", 0);

    if (node.contains("FileLeafRef") && node["FileLeafRef"].is_string()) {
        item.displayName = node["FileLeafRef"].get<std::string>();
    }
    if (item.displayName.empty() && node.contains("Title") &&
        node["Title"].is_string()) {
        item.displayName = node["Title"].get<std::string>();
    }

    item.complianceFlag = optionalInt(node, "_ComplianceFlags");
    return item;
}

ItemsPage parseItemsPage(const nlohmann::json& responseBody) {
    if (!responseBody.contains("value") || !responseBody["value"].is_array()) {
        throw std::runtime_error("Response missing 'value' array of items");
    }

    ItemsPage page;
    for (const auto& node : responseBody["value"]) {
        page.items.push_back(parseItemNode(node));
    }

    if (responseBody.contains("odata.nextLink") &&
        responseBody["odata.nextLink"].is_string()) {
        page.nextLink = responseBody["odata.nextLink"].get<std::string>();
    }
    return page;
}

std::optional<ComplianceLabel> parseComplianceTag(const nlohmann::json& responseBody) {
    if (responseBody.is_null()) return std::nullopt;

    // nometadata wraps complex results in "value" on some endpoints.
    const nlohmann::json* tag = &responseBody;
    if (responseBody.contains("value")) {
        tag = &responseBody["value"];
    }
    if (!tag->is_object() || !tag->contains("TagName")) return std::nullopt;

    const auto& name = (*tag)["TagName"];
    if (!name.is_string() || name.get<std::string>().empty()) return std::nullopt;

    return ComplianceLabel{name.get<std::string>()};
}

bool parseBooleanResult(const nlohmann::json& responseBody, bool fallback) {
    if (responseBody.is_boolean()) return responseBody.get<bool>();
    if (responseBody.is_object() && responseBody.contains("value") &&
        responseBody["value"].is_boolean()) {
        return responseBody["value"].get<bool>();
    }
    return fallback;
}

std::string extractODataError(const nlohmann::json& responseBody) {
    if (!responseBody.is_object()) return {};

    for (const char* key : {"odata.error", "error"}) {
        if (!responseBody.contains(key) || !responseBody[key].is_object()) continue;

        const auto& err = responseBody[key];
        if (err.contains("message")) {
            const auto& msg = err["message"];
            if (msg.is_string()) return msg.get<std::string>();
            if (msg.is_object()) return msg.value("value", "");
        }
    }
    return {};
}

} // namespace spo_sweep
