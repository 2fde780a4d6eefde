#pragma once

#include "decoder/MarketPayloadDecoder.hpp"
#include "domain/payload/PayloadDecodeError.hpp"
#include "domain/payload/RawPayload.hpp"
#include "domain/records/PlayerMarketLine.hpp"

#include <cstddef>
#include <functional>
#include <iostream>
#include <ostream>
#include <thread>
#include <vector>

namespace mld::services {

struct BatchResult {
    std::vector<mld::decoder::DecodeOutcome> outcomes;   // same order as the input
    std::vector<mld::domain::PlayerMarketLine> lines;    // every record, flattened
    std::vector<mld::domain::PayloadDecodeError> errors;
    mld::decoder::DecodeDiagnostics totals;
};

class PayloadDecodeService {
public:
    PayloadDecodeService(const mld::decoder::MarketPayloadDecoder& decoder,
                         int worker_threads = 1,
                         std::ostream& log = std::cerr);
    virtual ~PayloadDecodeService() = default;

    // A failed payload contributes an error and no lines; it never stops the
    // batch. Output order is independent of worker_threads.
    BatchResult decode_batch(const std::vector<mld::domain::RawPayload>& payloads) const;

protected:
    virtual std::thread start_worker(std::function<void()> work) const;

private:
    std::vector<mld::decoder::DecodeOutcome> decode_all(
        const std::vector<mld::domain::RawPayload>& payloads) const;

    const mld::decoder::MarketPayloadDecoder& decoder_;
    std::size_t worker_threads_;
    std::ostream& log_;
};

} // namespace mld::services
