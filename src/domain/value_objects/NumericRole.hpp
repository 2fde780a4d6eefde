#pragma once

#include <stdexcept>
#include <string>

namespace mld::domain {

enum class NumericRole { UNASSIGNED, LINE, OVER_PRICE, UNDER_PRICE };

inline std::string to_string(NumericRole role) {
    switch (role) {
        case NumericRole::UNASSIGNED: return "unassigned";
        case NumericRole::LINE: return "line";
        case NumericRole::OVER_PRICE: return "over_price";
        case NumericRole::UNDER_PRICE: return "under_price";
    }
    throw std::invalid_argument("Invalid numeric role");
}

inline NumericRole role_from_string(const std::string& str) {
    if (str == "unassigned") return NumericRole::UNASSIGNED;
    if (str == "line") return NumericRole::LINE;
    if (str == "over_price") return NumericRole::OVER_PRICE;
    if (str == "under_price") return NumericRole::UNDER_PRICE;
    throw std::invalid_argument("Invalid numeric role: " + str);
}

} // namespace mld::domain
