#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mld::domain {

// One identified market inside a payload. Numeric fields stay empty when no
// plausible candidate was found for them.
class MarketRecord {
public:
    MarketRecord(uint64_t numeric_id, std::string category_id,
                 std::optional<double> final_line,
                 std::optional<double> top_over_value,
                 std::optional<double> top_under_value);

    uint64_t numeric_id() const noexcept { return numeric_id_; }
    const std::string& category_id() const noexcept { return category_id_; }
    const std::optional<double>& final_line() const noexcept { return final_line_; }
    const std::optional<double>& top_over_value() const noexcept { return top_over_value_; }
    const std::optional<double>& top_under_value() const noexcept { return top_under_value_; }

    bool is_empty() const noexcept {
        return !final_line_ && !top_over_value_ && !top_under_value_;
    }

    bool operator==(const MarketRecord&) const = default;

private:
    uint64_t numeric_id_;
    std::string category_id_;
    std::optional<double> final_line_;
    std::optional<double> top_over_value_;
    std::optional<double> top_under_value_;
};

} // namespace mld::domain
