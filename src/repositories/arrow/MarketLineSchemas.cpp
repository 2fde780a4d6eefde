#include "repositories/arrow/MarketLineSchemas.hpp"

namespace mld::repositories::arrowfs {

std::shared_ptr<arrow::Schema> MarketLineSchemas::market_line_schema() {
    return arrow::schema({
        arrow::field("id", arrow::utf8(), /*nullable=*/false),
        arrow::field("market", arrow::utf8()),
        arrow::field("player_name", arrow::utf8(), /*nullable=*/false),
        arrow::field("decimal_odds", arrow::float64()),
        arrow::field("category_id", arrow::utf8(), /*nullable=*/false),
        arrow::field("numeric_id", arrow::uint64(), /*nullable=*/false),
        arrow::field("category_name", arrow::utf8()),
        arrow::field("group", arrow::utf8()),
        arrow::field("sport", arrow::utf8()),
        arrow::field("final_line", arrow::float64()),
        arrow::field("top_over_value", arrow::float64()),
        arrow::field("top_under_value", arrow::float64()),
    });
}

} // namespace mld::repositories::arrowfs
