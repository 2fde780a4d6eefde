#pragma once

#include "domain/value_objects/NumericRole.hpp"

#include <cstddef>

namespace mld::domain {

struct NumericCandidate {
    std::size_t byte_offset;
    double value;
    NumericRole role = NumericRole::UNASSIGNED;

    bool operator==(const NumericCandidate&) const = default;
};

} // namespace mld::domain
