#pragma once

#include "config/Settings.hpp"
#include "decoder/NumericFieldExtractor.hpp"
#include "decoder/RoleAssigner.hpp"
#include "domain/payload/IdentifierToken.hpp"
#include "domain/payload/NumericCandidate.hpp"
#include "domain/records/MarketRecord.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mld::decoder {

// Origin of the byte_stride grid a token's fields sit on.
enum class FieldAnchor { TOKEN, BUFFER };

FieldAnchor field_anchor_from_string(const std::string& str);

struct Assembly {
    std::vector<domain::MarketRecord> records;  // token offset order
    std::size_t dropped_empty = 0;
};

// Pairs each token with the candidates in its window:
//   [token end, min(next token offset, buffer end, token end + lookahead_window))
// Fields lie every byte_stride bytes from the token start (from offset 0 under
// FieldAnchor::BUFFER); candidates off that grid are ignored. A candidate
// belongs to a window only if its whole field fits inside it, so no candidate
// is ever attributed to two tokens.
class RecordAssembler {
public:
    RecordAssembler(const config::DecoderSettings& settings,
                    std::shared_ptr<const IRoleAssigner> assigner);

    // One window per token, in token offset order.
    std::vector<FieldWindow> windows(const std::vector<domain::IdentifierToken>& tokens,
                                     std::size_t buffer_size) const;

    Assembly assemble(const std::vector<domain::IdentifierToken>& tokens,
                      const std::vector<domain::NumericCandidate>& candidates,
                      std::size_t buffer_size) const;

private:
    FieldWindow window_for(const std::vector<domain::IdentifierToken>& ordered,
                           std::size_t index, std::size_t buffer_size) const;
    domain::MarketRecord build_record(const domain::IdentifierToken& token,
                                      const std::vector<domain::NumericCandidate>& assigned) const;

    std::shared_ptr<const IRoleAssigner> assigner_;
    std::size_t lookahead_window_;
    std::size_t stride_;
    FieldAnchor anchor_;
    bool keep_empty_records_;
    double price_scale_;
};

} // namespace mld::decoder
