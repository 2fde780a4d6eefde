#include "decoder/Inflate.hpp"

#include <zlib.h>

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace mld::decoder {

std::optional<domain::ByteBuffer> inflate_bytes(std::span<const uint8_t> input,
                                                std::size_t max_output) {
    if (input.empty() || input.size() > std::numeric_limits<uInt>::max()) {
        return std::nullopt;
    }

    z_stream strm{};
    // +32: accept both zlib and gzip headers
    if (inflateInit2(&strm, MAX_WBITS + 32) != Z_OK) {
        return std::nullopt;
    }

    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());

    domain::ByteBuffer out;
    std::array<uint8_t, 16384> chunk{};
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        strm.next_out = chunk.data();
        strm.avail_out = static_cast<uInt>(chunk.size());

        // Z_BUF_ERROR here means the input ran out before the stream ended
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return std::nullopt;
        }

        std::size_t produced = chunk.size() - strm.avail_out;
        if (out.size() + produced > max_output) {
            inflateEnd(&strm);
            return std::nullopt;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + produced);
    }

    bool trailing = strm.avail_in != 0;
    inflateEnd(&strm);
    if (trailing) return std::nullopt;
    return out;
}

domain::ByteBuffer deflate_bytes(std::span<const uint8_t> input) {
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    domain::ByteBuffer out(bound);

    int ret = compress2(out.data(), &bound, input.data(),
                        static_cast<uLong>(input.size()), Z_DEFAULT_COMPRESSION);
    if (ret != Z_OK) {
        throw std::runtime_error("zlib compress2 failed (error " + std::to_string(ret) + ")");
    }
    out.resize(bound);
    return out;
}

} // namespace mld::decoder
