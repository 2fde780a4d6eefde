#include "services/MarketLineJoiner.hpp"

#include <algorithm>
#include <cctype>

using namespace mld::domain;

namespace mld::services {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

MarketLineJoiner::MarketLineJoiner(const std::vector<CategoryInfo>& categories) {
    // First occurrence wins so the join stays one-to-one
    for (const auto& category : categories) {
        by_id_.emplace(category.category_id, category);
    }
}

std::vector<JoinedMarketLine> MarketLineJoiner::join(
    const std::vector<PlayerMarketLine>& lines) const {
    std::vector<JoinedMarketLine> joined;
    joined.reserve(lines.size());

    for (const auto& line : lines) {
        JoinedMarketLine row;
        row.id = line.category_id + "-" + std::to_string(line.numeric_id);
        row.line = line;

        auto it = by_id_.find(line.category_id);
        if (it != by_id_.end()) {
            row.category = it->second;
            row.market = map_market(it->second.name, it->second.group);
        }
        row.decimal_odds = pick_decimal_odds(line);
        joined.push_back(std::move(row));
    }
    return joined;
}

std::optional<std::string> MarketLineJoiner::map_market(const std::string& category_name,
                                                        const std::string& group_name) {
    if (category_name.empty()) return std::nullopt;

    auto cn = lower(category_name);
    auto gn = lower(group_name);

    if (contains(cn, "points") || contains(cn, "pts") || contains(gn, "points")) {
        return "player_points";
    }
    if (contains(cn, "total") || contains(cn, "over") || contains(cn, "under") ||
        contains(gn, "total")) {
        return "team_total";
    }
    if (contains(cn, "money") || contains(cn, "ml")) {
        return "moneyline";
    }

    std::replace(cn.begin(), cn.end(), ' ', '_');
    return cn;
}

std::optional<double> MarketLineJoiner::pick_decimal_odds(const PlayerMarketLine& line) {
    if (line.top_over_value) return line.top_over_value;
    return line.final_line;
}

} // namespace mld::services
