#pragma once

#include "config/Settings.hpp"
#include "decoder/IdentifierScanner.hpp"
#include "decoder/NumericFieldExtractor.hpp"
#include "decoder/PayloadUnwrapper.hpp"
#include "decoder/RecordAssembler.hpp"
#include "decoder/RoleAssigner.hpp"
#include "domain/payload/PayloadDecodeError.hpp"
#include "domain/payload/RawPayload.hpp"
#include "domain/records/MarketRecord.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mld::decoder {

// Non-error conditions worth counting. None of these fail a payload.
struct DecodeDiagnostics {
    std::size_t tokens_found = 0;
    std::size_t tokens_rejected = 0;
    std::size_t candidates_accepted = 0;
    std::size_t implausible_discarded = 0;
    std::size_t records_dropped_empty = 0;

    DecodeDiagnostics& operator+=(const DecodeDiagnostics& other);
    bool operator==(const DecodeDiagnostics&) const = default;
};

struct DecodeOutcome {
    std::string player_name;
    std::vector<domain::MarketRecord> records;
    std::optional<domain::PayloadDecodeError> error;
    DecodeDiagnostics diagnostics;

    bool ok() const noexcept { return !error.has_value(); }
};

// Unwrap -> {scan identifiers, extract numeric fields} -> assemble.
// Holds only immutable configuration, so one instance may be shared by any
// number of threads.
class MarketPayloadDecoder {
public:
    explicit MarketPayloadDecoder(const config::DecoderSettings& settings);
    MarketPayloadDecoder(const config::DecoderSettings& settings,
                         std::shared_ptr<const IRoleAssigner> assigner);

    DecodeOutcome decode(const domain::RawPayload& payload) const;

    // Skips the unwrap stage; for buffers that are already inflated.
    DecodeOutcome decode_buffer(std::string player_name,
                                std::span<const uint8_t> buffer) const;

    const PayloadUnwrapper& unwrapper() const noexcept { return unwrapper_; }
    const IdentifierScanner& scanner() const noexcept { return scanner_; }
    const NumericFieldExtractor& extractor() const noexcept { return extractor_; }
    const RecordAssembler& assembler() const noexcept { return assembler_; }

private:
    PayloadUnwrapper unwrapper_;
    IdentifierScanner scanner_;
    NumericFieldExtractor extractor_;
    RecordAssembler assembler_;
};

} // namespace mld::decoder
