#include "decoder/IdentifierScanner.hpp"

#include "decoder/Base64.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string_view>

using namespace mld::domain;

namespace mld::decoder {

namespace {

bool is_digit(uint8_t c) noexcept {
    return c >= '0' && c <= '9';
}

// Parses the leading digit run of text. Empty or overflowing runs yield nullopt.
std::optional<uint64_t> parse_digits(std::string_view text, std::size_t& length) {
    length = 0;
    while (length < text.size() && is_digit(static_cast<uint8_t>(text[length]))) {
        ++length;
    }
    if (length == 0) return std::nullopt;

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + length, value);
    if (ec != std::errc() || ptr != text.data() + length) return std::nullopt;
    return value;
}

std::string strip_padding(std::string text) {
    while (!text.empty() && text.back() == '=') {
        text.pop_back();
    }
    return text;
}

} // anonymous namespace

TokenEncoding token_encoding_from_string(const std::string& str) {
    if (str == "base64") return TokenEncoding::BASE64_GLOBAL_ID;
    if (str == "plain") return TokenEncoding::PLAIN_DIGITS;
    throw std::invalid_argument("Invalid token encoding: " + str);
}

IdentifierScanner::IdentifierScanner(config::IdentifierPattern pattern)
    : pattern_(std::move(pattern))
    , encoding_(token_encoding_from_string(pattern_.encoding)) {
    if (pattern_.prefix.empty()) {
        throw std::invalid_argument("IdentifierScanner prefix must not be empty");
    }
}

IdentifierScan IdentifierScanner::scan(std::span<const uint8_t> buffer) const {
    IdentifierScan result;
    std::string_view haystack(reinterpret_cast<const char*>(buffer.data()), buffer.size());

    std::size_t pos = haystack.find(pattern_.prefix);
    while (pos != std::string_view::npos) {
        std::size_t end = token_end(buffer, pos);
        auto token = decode_token(std::string(haystack.substr(pos, end - pos)), pos);

        std::size_t resume = pos + 1;
        if (token) {
            resume = token->end_offset();
            result.tokens.push_back(std::move(*token));
        } else {
            ++result.rejected;
        }
        pos = haystack.find(pattern_.prefix, resume);
    }
    return result;
}

// Greedy extent of the raw match starting at start, capped at max_token_length.
std::size_t IdentifierScanner::token_end(std::span<const uint8_t> buffer,
                                         std::size_t start) const {
    std::size_t limit = std::min(buffer.size(),
                                 start + static_cast<std::size_t>(pattern_.max_token_length));
    std::size_t end = std::min(limit, start + pattern_.prefix.size());

    if (encoding_ == TokenEncoding::PLAIN_DIGITS) {
        while (end < limit && is_digit(buffer[end])) ++end;
        return end;
    }

    while (end < limit && is_base64_char(buffer[end])) ++end;
    for (int pad = 0; pad < 2 && end < limit && buffer[end] == '='; ++pad) ++end;
    return end;
}

std::optional<IdentifierToken> IdentifierScanner::decode_token(std::string raw,
                                                               std::size_t offset) const {
    if (encoding_ == TokenEncoding::PLAIN_DIGITS) {
        return decode_plain(std::move(raw), offset);
    }
    return decode_global_id(std::move(raw), offset);
}

std::optional<IdentifierToken> IdentifierScanner::decode_global_id(std::string raw,
                                                                   std::size_t offset) const {
    std::string body = strip_padding(raw);
    // A lone trailing sextet carries no whole byte; it is drift from the next field.
    if (body.size() % 4 == 1) body.pop_back();

    auto bytes = base64_decode(body);
    if (!bytes) return std::nullopt;

    std::string_view text(reinterpret_cast<const char*>(bytes->data()), bytes->size());
    auto marker = text.find(pattern_.id_marker);
    if (marker == std::string_view::npos) return std::nullopt;

    std::size_t digits_at = marker + pattern_.id_marker.size();
    std::size_t digit_count = 0;
    auto numeric_id = parse_digits(text.substr(digits_at), digit_count);
    if (!numeric_id) return std::nullopt;

    // Re-encode only the recognised global id so bytes swept up by the
    // greedy match never reach the join key.
    auto global_id = text.substr(0, digits_at + digit_count);
    auto category_id = strip_padding(base64_encode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(global_id.data()), global_id.size())));

    // The token ends with the encoding of the global id plus any padding
    // present; base64-alphabet field bytes after it stay in the numeric window.
    std::size_t length = std::min(raw.size(), (global_id.size() * 4 + 2) / 3);
    std::size_t padded = length + (4 - length % 4) % 4;
    while (length < padded && length < raw.size() && raw[length] == '=') ++length;

    return IdentifierToken{std::move(raw), std::move(category_id), *numeric_id, offset, length};
}

std::optional<IdentifierToken> IdentifierScanner::decode_plain(std::string raw,
                                                               std::size_t offset) const {
    if (raw.size() <= pattern_.prefix.size()) return std::nullopt;

    std::size_t digit_count = 0;
    auto numeric_id = parse_digits(std::string_view(raw).substr(pattern_.prefix.size()),
                                   digit_count);
    if (!numeric_id) return std::nullopt;

    std::size_t length = raw.size();
    std::string category_id = raw;
    return IdentifierToken{std::move(raw), std::move(category_id), *numeric_id, offset, length};
}

} // namespace mld::decoder
