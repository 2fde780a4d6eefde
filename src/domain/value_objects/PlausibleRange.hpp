#pragma once

namespace mld::domain {

// Inclusive bounds a decoded float must fall in to count as betting data.
class PlausibleRange {
public:
    PlausibleRange(double min, double max);

    double min() const noexcept { return min_; }
    double max() const noexcept { return max_; }

    // False for NaN and infinities regardless of the bounds.
    bool contains(double value) const noexcept;

    bool operator==(const PlausibleRange&) const = default;

private:
    double min_;
    double max_;
};

} // namespace mld::domain
