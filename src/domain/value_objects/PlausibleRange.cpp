#include "domain/value_objects/PlausibleRange.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace mld::domain {

PlausibleRange::PlausibleRange(double min, double max) : min_(min), max_(max) {
    if (!std::isfinite(min) || !std::isfinite(max)) {
        throw std::invalid_argument("PlausibleRange bounds must be finite");
    }
    if (min >= max) {
        throw std::invalid_argument(
            "PlausibleRange min must be below max, got: " + std::to_string(min) +
            " >= " + std::to_string(max));
    }
}

bool PlausibleRange::contains(double value) const noexcept {
    return std::isfinite(value) && value >= min_ && value <= max_;
}

} // namespace mld::domain
