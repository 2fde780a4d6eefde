#pragma once

#include <arrow/api.h>

namespace mld::repositories::arrowfs {

class MarketLineSchemas {
public:
    // Flat output row; every optional column is nullable.
    static std::shared_ptr<arrow::Schema> market_line_schema();
};

} // namespace mld::repositories::arrowfs
