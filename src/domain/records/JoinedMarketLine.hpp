#pragma once

#include "domain/records/PlayerMarketLine.hpp"
#include "domain/value_objects/CategoryInfo.hpp"

#include <optional>
#include <string>

namespace mld::domain {

struct JoinedMarketLine {
    std::string id;                         // "<category_id>-<numeric_id>"
    PlayerMarketLine line;
    std::optional<CategoryInfo> category;   // empty when the left join missed
    std::optional<std::string> market;
    std::optional<double> decimal_odds;

    bool operator==(const JoinedMarketLine&) const = default;
};

} // namespace mld::domain
