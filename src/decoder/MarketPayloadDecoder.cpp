#include "decoder/MarketPayloadDecoder.hpp"

#include <variant>
#include <vector>

using namespace mld::domain;

namespace mld::decoder {

DecodeDiagnostics& DecodeDiagnostics::operator+=(const DecodeDiagnostics& other) {
    tokens_found += other.tokens_found;
    tokens_rejected += other.tokens_rejected;
    candidates_accepted += other.candidates_accepted;
    implausible_discarded += other.implausible_discarded;
    records_dropped_empty += other.records_dropped_empty;
    return *this;
}

MarketPayloadDecoder::MarketPayloadDecoder(const config::DecoderSettings& settings)
    : MarketPayloadDecoder(settings, make_role_assigner(settings.role_strategy)) {}

MarketPayloadDecoder::MarketPayloadDecoder(const config::DecoderSettings& settings,
                                           std::shared_ptr<const IRoleAssigner> assigner)
    : unwrapper_(settings)
    , scanner_(settings.identifier)
    , extractor_(settings)
    , assembler_(settings, std::move(assigner)) {}

DecodeOutcome MarketPayloadDecoder::decode(const RawPayload& payload) const {
    auto unwrapped = unwrapper_.unwrap(payload);
    if (auto* error = std::get_if<PayloadDecodeError>(&unwrapped)) {
        DecodeOutcome outcome;
        outcome.player_name = payload.player_name;
        outcome.error = std::move(*error);
        return outcome;
    }
    return decode_buffer(payload.player_name, std::get<ByteBuffer>(unwrapped));
}

DecodeOutcome MarketPayloadDecoder::decode_buffer(std::string player_name,
                                                  std::span<const uint8_t> buffer) const {
    DecodeOutcome outcome;
    outcome.player_name = std::move(player_name);

    auto ids = scanner_.scan(buffer);
    outcome.diagnostics.tokens_found = ids.tokens.size();
    outcome.diagnostics.tokens_rejected = ids.rejected;
    if (ids.tokens.empty()) {
        return outcome;
    }

    // Only fields inside some token's window are decoded; windows never overlap
    std::vector<NumericCandidate> candidates;
    for (const auto& window : assembler_.windows(ids.tokens, buffer.size())) {
        auto numbers = extractor_.extract(buffer, window);
        candidates.insert(candidates.end(), numbers.candidates.begin(), numbers.candidates.end());
        outcome.diagnostics.implausible_discarded += numbers.implausible_discarded;
    }
    outcome.diagnostics.candidates_accepted = candidates.size();

    auto assembly = assembler_.assemble(ids.tokens, candidates, buffer.size());
    outcome.diagnostics.records_dropped_empty = assembly.dropped_empty;
    outcome.records = std::move(assembly.records);
    return outcome;
}

} // namespace mld::decoder
