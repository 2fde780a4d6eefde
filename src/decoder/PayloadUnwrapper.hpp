#pragma once

#include "config/Settings.hpp"
#include "domain/payload/ByteBuffer.hpp"
#include "domain/payload/PayloadDecodeError.hpp"
#include "domain/payload/RawPayload.hpp"

#include <cstddef>
#include <variant>

namespace mld::decoder {

using UnwrapResult = std::variant<domain::ByteBuffer, domain::PayloadDecodeError>;

// markets64 text -> base64 decode -> inflate -> flat byte buffer.
// Never throws for malformed payload content; failures come back as
// PayloadDecodeError tagged with the stage that rejected the input.
class PayloadUnwrapper {
public:
    explicit PayloadUnwrapper(const config::DecoderSettings& settings);

    UnwrapResult unwrap(const domain::RawPayload& payload) const;

private:
    std::size_t max_inflated_bytes_;
    bool fallback_to_raw_;
};

} // namespace mld::decoder
