#include "domain/records/MarketRecord.hpp"

#include <stdexcept>

namespace mld::domain {

MarketRecord::MarketRecord(uint64_t numeric_id, std::string category_id,
                           std::optional<double> final_line,
                           std::optional<double> top_over_value,
                           std::optional<double> top_under_value)
    : numeric_id_(numeric_id)
    , category_id_(std::move(category_id))
    , final_line_(final_line)
    , top_over_value_(top_over_value)
    , top_under_value_(top_under_value) {
    if (category_id_.empty()) {
        throw std::invalid_argument("MarketRecord category_id must not be empty");
    }
}

} // namespace mld::domain
