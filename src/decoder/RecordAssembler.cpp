#include "decoder/RecordAssembler.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

using namespace mld::domain;

namespace mld::decoder {

namespace {

std::vector<IdentifierToken> by_offset(const std::vector<IdentifierToken>& tokens) {
    std::vector<IdentifierToken> ordered(tokens);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const IdentifierToken& a, const IdentifierToken& b) {
                         return a.byte_offset < b.byte_offset;
                     });
    return ordered;
}

} // anonymous namespace

FieldAnchor field_anchor_from_string(const std::string& str) {
    if (str == "token") return FieldAnchor::TOKEN;
    if (str == "buffer") return FieldAnchor::BUFFER;
    throw std::invalid_argument("Invalid field anchor: " + str);
}

RecordAssembler::RecordAssembler(const config::DecoderSettings& settings,
                                 std::shared_ptr<const IRoleAssigner> assigner)
    : assigner_(std::move(assigner))
    , lookahead_window_(0)
    , stride_(0)
    , anchor_(field_anchor_from_string(settings.field_anchor))
    , keep_empty_records_(settings.keep_empty_records)
    , price_scale_(settings.price_scale_constant) {
    if (!assigner_) {
        throw std::invalid_argument("RecordAssembler requires a role assigner");
    }
    if (settings.lookahead_window <= 0) {
        throw std::invalid_argument(
            "lookahead_window must be positive, got: " + std::to_string(settings.lookahead_window));
    }
    if (settings.byte_stride <= 0) {
        throw std::invalid_argument(
            "byte_stride must be positive, got: " + std::to_string(settings.byte_stride));
    }
    lookahead_window_ = static_cast<std::size_t>(settings.lookahead_window);
    stride_ = static_cast<std::size_t>(settings.byte_stride);
}

FieldWindow RecordAssembler::window_for(const std::vector<IdentifierToken>& ordered,
                                        std::size_t index, std::size_t buffer_size) const {
    const auto& token = ordered[index];

    FieldWindow window;
    window.anchor = anchor_ == FieldAnchor::TOKEN ? token.byte_offset : 0;
    window.begin = token.end_offset();
    window.end = std::min(buffer_size, window.begin + lookahead_window_);
    if (index + 1 < ordered.size()) {
        window.end = std::min(window.end, ordered[index + 1].byte_offset);
    }
    window.end = std::max(window.end, window.begin);
    return window;
}

std::vector<FieldWindow> RecordAssembler::windows(const std::vector<IdentifierToken>& tokens,
                                                  std::size_t buffer_size) const {
    auto ordered = by_offset(tokens);
    std::vector<FieldWindow> result;
    result.reserve(ordered.size());
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        result.push_back(window_for(ordered, i, buffer_size));
    }
    return result;
}

Assembly RecordAssembler::assemble(const std::vector<IdentifierToken>& tokens,
                                   const std::vector<NumericCandidate>& candidates,
                                   std::size_t buffer_size) const {
    // Both scanners already emit ascending offsets; sorting copies keeps the
    // pairing correct for hand-built inputs as well.
    auto ordered_tokens = by_offset(tokens);
    std::vector<NumericCandidate> ordered(candidates);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const NumericCandidate& a, const NumericCandidate& b) {
                         return a.byte_offset < b.byte_offset;
                     });

    Assembly result;
    for (std::size_t i = 0; i < ordered_tokens.size(); ++i) {
        auto window = window_for(ordered_tokens, i, buffer_size);

        auto it = std::lower_bound(ordered.begin(), ordered.end(), window.begin,
                                   [](const NumericCandidate& c, std::size_t off) {
                                       return c.byte_offset < off;
                                   });
        std::vector<NumericCandidate> in_window;
        for (; it != ordered.end() &&
               it->byte_offset + NumericFieldExtractor::kFieldWidth <= window.end; ++it) {
            if ((it->byte_offset - window.anchor) % stride_ == 0) {
                in_window.push_back(*it);
            }
        }

        auto assigned = assigner_->assign(std::span<const NumericCandidate>(in_window));

        auto record = build_record(ordered_tokens[i], assigned);
        if (record.is_empty() && !keep_empty_records_) {
            ++result.dropped_empty;
            continue;
        }
        result.records.push_back(std::move(record));
    }
    return result;
}

MarketRecord RecordAssembler::build_record(const IdentifierToken& token,
                                           const std::vector<NumericCandidate>& assigned) const {
    auto first_with = [&](NumericRole role) -> std::optional<double> {
        auto it = std::find_if(assigned.begin(), assigned.end(),
                               [role](const NumericCandidate& c) { return c.role == role; });
        if (it == assigned.end()) return std::nullopt;
        return it->value;
    };

    auto scaled = [this](std::optional<double> price) -> std::optional<double> {
        if (!price) return std::nullopt;
        return *price * price_scale_;
    };

    return MarketRecord(token.numeric_id, token.category_id,
                        first_with(NumericRole::LINE),
                        scaled(first_with(NumericRole::OVER_PRICE)),
                        scaled(first_with(NumericRole::UNDER_PRICE)));
}

} // namespace mld::decoder
