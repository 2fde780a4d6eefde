#pragma once

#include "config/Settings.hpp"
#include "domain/payload/NumericCandidate.hpp"
#include "domain/value_objects/PlausibleRange.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mld::decoder {

struct NumericScan {
    std::vector<domain::NumericCandidate> candidates;  // ascending byte_offset
    std::size_t implausible_discarded = 0;
};

// Byte range [begin, end) whose fields sit at anchor + k * byte_stride.
struct FieldWindow {
    std::size_t anchor;
    std::size_t begin;
    std::size_t end;

    bool operator==(const FieldWindow&) const = default;
};

// Walks a window at byte_stride and decodes each field that fits entirely
// inside it as a little-endian float32. Only plausible values survive.
class NumericFieldExtractor {
public:
    static constexpr std::size_t kFieldWidth = sizeof(float);

    explicit NumericFieldExtractor(const config::DecoderSettings& settings);

    // Whole buffer, grid anchored at offset 0.
    NumericScan extract(std::span<const uint8_t> buffer) const;
    NumericScan extract(std::span<const uint8_t> buffer, const FieldWindow& window) const;

    const domain::PlausibleRange& range() const noexcept { return range_; }

private:
    std::size_t stride_;
    domain::PlausibleRange range_;
};

// Reads kFieldWidth bytes at p as a little-endian IEEE-754 single.
float read_float_le(const uint8_t* p) noexcept;

} // namespace mld::decoder
