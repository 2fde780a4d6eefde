#pragma once

#include <stdexcept>
#include <string>

namespace mld::domain {

enum class DecodeStage { BASE64, INFLATE };

inline std::string to_string(DecodeStage stage) {
    switch (stage) {
        case DecodeStage::BASE64: return "base64";
        case DecodeStage::INFLATE: return "inflate";
    }
    throw std::invalid_argument("Invalid decode stage");
}

// Per-payload, recoverable: the payload yields no records.
struct PayloadDecodeError {
    DecodeStage stage;
    std::string player_name;
    std::string reason;

    bool operator==(const PayloadDecodeError&) const = default;
};

} // namespace mld::domain
