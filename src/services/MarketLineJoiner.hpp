#pragma once

#include "domain/records/JoinedMarketLine.hpp"
#include "domain/records/PlayerMarketLine.hpp"
#include "domain/value_objects/CategoryInfo.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mld::services {

// Left-joins decoded lines against the category table on category_id and
// derives the flat output fields (id, market, decimal_odds).
class MarketLineJoiner {
public:
    explicit MarketLineJoiner(const std::vector<mld::domain::CategoryInfo>& categories);

    std::vector<mld::domain::JoinedMarketLine> join(
        const std::vector<mld::domain::PlayerMarketLine>& lines) const;

    std::size_t category_count() const noexcept { return by_id_.size(); }

    // Canonical market type from free-form category and group names.
    static std::optional<std::string> map_market(const std::string& category_name,
                                                 const std::string& group_name);

    static std::optional<double> pick_decimal_odds(const mld::domain::PlayerMarketLine& line);

private:
    std::map<std::string, mld::domain::CategoryInfo> by_id_;
};

} // namespace mld::services
