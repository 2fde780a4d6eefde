#include "decoder/Base64.hpp"

#include <cctype>

namespace mld::decoder {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int sextet_value(uint8_t c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

bool is_base64_char(uint8_t c) noexcept {
    return sextet_value(c) >= 0;
}

std::optional<domain::ByteBuffer> base64_decode(std::string_view text) {
    domain::ByteBuffer out;
    out.reserve(text.size() / 4 * 3 + 3);

    uint32_t acc = 0;
    int bits = 0;
    std::size_t sextets = 0;
    std::size_t padding = 0;

    for (char ch : text) {
        auto c = static_cast<uint8_t>(ch);
        if (std::isspace(c)) continue;

        if (c == '=') {
            if (++padding > 2) return std::nullopt;
            continue;
        }
        if (padding > 0) return std::nullopt;  // data after padding

        int value = sextet_value(c);
        if (value < 0) return std::nullopt;

        acc = ((acc << 6) | static_cast<uint32_t>(value)) & 0xFFFFFFu;
        bits += 6;
        ++sextets;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFFu));
        }
    }

    if (sextets % 4 == 1) return std::nullopt;
    if (padding > 0 && (sextets + padding) % 4 != 0) return std::nullopt;
    return out;
}

std::string base64_encode(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | bytes[i + 2];
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(bytes[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace mld::decoder
