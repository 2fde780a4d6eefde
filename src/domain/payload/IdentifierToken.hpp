#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mld::domain {

struct IdentifierToken {
    std::string raw_token;      // greedy match, still encoded; may run past the token
    std::string category_id;    // unpadded base64 global id, the join key
    uint64_t numeric_id;
    std::size_t byte_offset;
    std::size_t byte_length;    // encoded global id plus padding; the numeric window starts after it

    std::size_t end_offset() const noexcept { return byte_offset + byte_length; }

    bool operator==(const IdentifierToken&) const = default;
};

} // namespace mld::domain
