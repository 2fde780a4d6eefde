#include "services/MarketLinePipeline.hpp"
#include "services/MarketLineJoiner.hpp"

#include <algorithm>

namespace mld::services {

MarketLinePipeline::MarketLinePipeline(IPayloadSource& source,
                                       mld::repositories::IMarketLineRepository& repository,
                                       const PayloadDecodeService& decode_service)
    : source_(source), repository_(repository), decode_service_(decode_service) {}

PipelineStats MarketLinePipeline::run() {
    auto payloads = source_.fetch_payloads();
    auto categories = source_.fetch_categories();

    auto batch = decode_service_.decode_batch(payloads);
    MarketLineJoiner joiner(categories);
    auto joined = joiner.join(batch.lines);

    repository_.write(joined);

    PipelineStats stats;
    stats.players = payloads.size();
    stats.lines = joined.size();
    stats.errors = batch.errors.size();
    stats.categories = joiner.category_count();
    stats.matched = static_cast<std::size_t>(std::count_if(
        joined.begin(), joined.end(), [](const auto& row) { return row.category.has_value(); }));
    stats.diagnostics = batch.totals;
    return stats;
}

} // namespace mld::services
