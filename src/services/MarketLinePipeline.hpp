#pragma once

#include "repositories/IMarketLineRepository.hpp"
#include "services/IPayloadSource.hpp"
#include "services/PayloadDecodeService.hpp"

#include <cstddef>

namespace mld::services {

struct PipelineStats {
    std::size_t players = 0;
    std::size_t lines = 0;
    std::size_t errors = 0;
    std::size_t categories = 0;
    std::size_t matched = 0;          // lines joined to a known category
    mld::decoder::DecodeDiagnostics diagnostics;
};

// fetch -> decode -> join -> write, once.
class MarketLinePipeline {
public:
    MarketLinePipeline(IPayloadSource& source,
                       mld::repositories::IMarketLineRepository& repository,
                       const PayloadDecodeService& decode_service);

    PipelineStats run();

private:
    IPayloadSource& source_;
    mld::repositories::IMarketLineRepository& repository_;
    const PayloadDecodeService& decode_service_;
};

} // namespace mld::services
