#include "infrastructure/HotStreakResponseParser.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace mld::domain;

namespace mld::infrastructure {

namespace {

const json& child(const json& obj, const char* key) {
    static const json kNull;
    if (!obj.is_object()) return kNull;
    auto it = obj.find(key);
    return it == obj.end() ? kNull : *it;
}

std::string string_or(const json& obj, const char* key, const std::string& fallback) {
    const auto& value = child(obj, key);
    return value.is_string() ? value.get<std::string>() : fallback;
}

} // anonymous namespace

std::vector<RawPayload> HotStreakResponseParser::parse_search(const std::string& json_str) const {
    auto root = json::parse(json_str);
    const auto& results = child(child(child(root, "data"), "search"), "results");

    std::vector<RawPayload> payloads;
    if (!results.is_array()) return payloads;

    for (const auto& result : results) {
        auto markets64 = string_or(result, "markets64", "");
        if (markets64.empty()) continue;

        const auto& player = child(child(result, "participant"), "player");
        auto name = string_or(player, "fullName", "");
        if (name.empty()) name = string_or(player, "firstName", "");
        if (name.empty()) name = "Unknown";

        payloads.push_back(RawPayload{std::move(name), std::move(markets64)});
    }
    return payloads;
}

std::vector<CategoryInfo> HotStreakResponseParser::parse_system(const std::string& json_str) const {
    auto root = json::parse(json_str);
    const auto& sports = child(child(child(root, "data"), "system"), "sports");

    std::vector<CategoryInfo> categories;
    if (!sports.is_array()) return categories;

    for (const auto& sport : sports) {
        auto sport_name = string_or(sport, "name", "Unknown");
        const auto& list = child(sport, "categories");
        if (!list.is_array()) continue;

        for (const auto& cat : list) {
            // Categories without an id can never match a decoded token
            auto id = string_or(cat, "id", "");
            if (id.empty()) continue;

            categories.push_back(CategoryInfo{
                std::move(id),
                string_or(cat, "name", "Unnamed Category"),
                string_or(cat, "groupName", "Unknown"),
                sport_name,
            });
        }
    }
    return categories;
}

} // namespace mld::infrastructure
