#pragma once

#include <string>

namespace mld::domain {

// One row of the sportsbook's category name table.
struct CategoryInfo {
    std::string category_id;
    std::string name;
    std::string group;
    std::string sport;

    bool operator==(const CategoryInfo&) const = default;
};

} // namespace mld::domain
