#include "decoder/PayloadUnwrapper.hpp"

#include "decoder/Base64.hpp"
#include "decoder/Inflate.hpp"

#include <algorithm>
#include <cctype>
#include <string>

using namespace mld::domain;

namespace mld::decoder {

PayloadUnwrapper::PayloadUnwrapper(const config::DecoderSettings& settings)
    : max_inflated_bytes_(settings.max_inflated_bytes)
    , fallback_to_raw_(settings.inflate_fallback_to_raw) {}

UnwrapResult PayloadUnwrapper::unwrap(const RawPayload& payload) const {
    const auto& text = payload.payload_text;
    bool blank = std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    if (blank) {
        return PayloadDecodeError{DecodeStage::BASE64, payload.player_name, "empty payload"};
    }

    auto decoded = base64_decode(text);
    if (!decoded) {
        return PayloadDecodeError{DecodeStage::BASE64, payload.player_name,
                                  "payload is not valid base64"};
    }

    auto inflated = inflate_bytes(*decoded, max_inflated_bytes_);
    if (!inflated) {
        if (fallback_to_raw_) {
            return std::move(*decoded);
        }
        return PayloadDecodeError{
            DecodeStage::INFLATE, payload.player_name,
            "zlib stream is corrupt, truncated, or larger than " +
                std::to_string(max_inflated_bytes_) + " bytes"};
    }
    return std::move(*inflated);
}

} // namespace mld::decoder
