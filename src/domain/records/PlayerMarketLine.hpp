#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mld::domain {

// A decoded market tagged with the player it came from. This is what the
// decoder hands to the join step.
struct PlayerMarketLine {
    std::string player_name;
    std::string category_id;
    uint64_t numeric_id;
    std::optional<double> final_line;
    std::optional<double> top_over_value;
    std::optional<double> top_under_value;

    bool operator==(const PlayerMarketLine&) const = default;
};

} // namespace mld::domain
