#pragma once

#include "domain/payload/ByteBuffer.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mld::decoder {

// Standard-alphabet base64. Whitespace is skipped and missing '=' padding is
// tolerated. Returns nullopt for foreign characters, data after padding, or a
// dangling single sextet.
std::optional<domain::ByteBuffer> base64_decode(std::string_view text);

// Padded standard-alphabet encoding.
std::string base64_encode(std::span<const uint8_t> bytes);

bool is_base64_char(uint8_t c) noexcept;

} // namespace mld::decoder
