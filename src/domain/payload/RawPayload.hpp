#pragma once

#include <string>

namespace mld::domain {

struct RawPayload {
    std::string player_name;
    std::string payload_text;   // markets64, base64 text as received
};

} // namespace mld::domain
