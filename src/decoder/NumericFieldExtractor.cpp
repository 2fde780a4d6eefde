#include "decoder/NumericFieldExtractor.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

using namespace mld::domain;

namespace mld::decoder {

static_assert(sizeof(float) == 4 && std::numeric_limits<float>::is_iec559,
              "markets64 fields are IEEE-754 singles");

float read_float_le(const uint8_t* p) noexcept {
    uint32_t bits = uint32_t(p[0])
                  | (uint32_t(p[1]) << 8)
                  | (uint32_t(p[2]) << 16)
                  | (uint32_t(p[3]) << 24);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

NumericFieldExtractor::NumericFieldExtractor(const config::DecoderSettings& settings)
    : stride_(0)
    , range_(settings.plausible_min, settings.plausible_max) {
    if (settings.byte_stride <= 0) {
        throw std::invalid_argument(
            "byte_stride must be positive, got: " + std::to_string(settings.byte_stride));
    }
    stride_ = static_cast<std::size_t>(settings.byte_stride);
}

NumericScan NumericFieldExtractor::extract(std::span<const uint8_t> buffer) const {
    return extract(buffer, FieldWindow{0, 0, buffer.size()});
}

NumericScan NumericFieldExtractor::extract(std::span<const uint8_t> buffer,
                                           const FieldWindow& window) const {
    NumericScan result;
    std::size_t end = std::min(window.end, buffer.size());
    if (end < kFieldWidth) return result;

    // First grid point at or after begin
    std::size_t offset = window.anchor;
    if (window.begin > window.anchor) {
        offset += (window.begin - window.anchor + stride_ - 1) / stride_ * stride_;
    }

    for (; offset <= end - kFieldWidth; offset += stride_) {
        double value = read_float_le(buffer.data() + offset);
        if (range_.contains(value)) {
            result.candidates.push_back(NumericCandidate{offset, value});
        } else {
            ++result.implausible_discarded;
        }
    }
    return result;
}

} // namespace mld::decoder
