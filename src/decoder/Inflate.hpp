#pragma once

#include "domain/payload/ByteBuffer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace mld::decoder {

// Inflates a zlib- or gzip-wrapped deflate stream. Returns nullopt when the
// stream is corrupt, truncated, followed by trailing bytes, or would inflate
// past max_output bytes.
std::optional<domain::ByteBuffer> inflate_bytes(std::span<const uint8_t> input,
                                                std::size_t max_output);

// zlib-wrapped deflate at the default level. Throws std::runtime_error on failure.
domain::ByteBuffer deflate_bytes(std::span<const uint8_t> input);

} // namespace mld::decoder
