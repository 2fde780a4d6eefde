#pragma once

#include "config/Settings.hpp"
#include "domain/payload/IdentifierToken.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mld::decoder {

enum class TokenEncoding { BASE64_GLOBAL_ID, PLAIN_DIGITS };

TokenEncoding token_encoding_from_string(const std::string& str);

struct IdentifierScan {
    std::vector<domain::IdentifierToken> tokens;  // ascending byte_offset
    std::size_t rejected = 0;                     // prefix matched, no numeric id
};

class IdentifierScanner {
public:
    explicit IdentifierScanner(config::IdentifierPattern pattern);

    // Total scan of the buffer. Accepted tokens never overlap, and scanning
    // resumes at a token's end so an adjacent token is still found.
    // Duplicates of the same category are all kept.
    IdentifierScan scan(std::span<const uint8_t> buffer) const;

private:
    std::size_t token_end(std::span<const uint8_t> buffer, std::size_t start) const;
    std::optional<domain::IdentifierToken> decode_token(std::string raw,
                                                        std::size_t offset) const;
    std::optional<domain::IdentifierToken> decode_global_id(std::string raw,
                                                            std::size_t offset) const;
    std::optional<domain::IdentifierToken> decode_plain(std::string raw,
                                                        std::size_t offset) const;

    config::IdentifierPattern pattern_;
    TokenEncoding encoding_;
};

} // namespace mld::decoder
