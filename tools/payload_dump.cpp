#include "config/Settings.hpp"
#include "decoder/MarketPayloadDecoder.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <variant>

// Prints every identifier token of one markets64 string, the plausible floats
// in each token's window, then the records the decoder assembles from them.
int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: payload_dump <markets64> [player_name]" << std::endl;
        return 1;
    }

    auto settings = mld::config::Settings::from_environment();
    try {
        settings.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return 1;
    }

    mld::domain::RawPayload payload{argc >= 3 ? argv[2] : "dump", argv[1]};
    mld::decoder::MarketPayloadDecoder decoder(settings.decoder);

    auto unwrapped = decoder.unwrapper().unwrap(payload);
    if (const auto* error = std::get_if<mld::domain::PayloadDecodeError>(&unwrapped)) {
        std::cerr << "[error] " << to_string(error->stage) << ": " << error->reason << std::endl;
        return 1;
    }
    const auto& buffer = std::get<mld::domain::ByteBuffer>(unwrapped);
    std::cout << "[buffer] " << buffer.size() << " bytes" << std::endl;

    auto scan = decoder.scanner().scan(buffer);
    for (const auto& token : scan.tokens) {
        std::cout << "[token] @" << token.byte_offset << " len=" << token.byte_length
                  << " id=" << token.numeric_id << " " << token.raw_token << std::endl;
    }

    std::size_t floats = 0;
    std::size_t implausible = 0;
    std::cout << std::fixed << std::setprecision(4);
    for (const auto& window : decoder.assembler().windows(scan.tokens, buffer.size())) {
        std::cout << "[window] [" << window.begin << ", " << window.end
                  << ") anchor=" << window.anchor << std::endl;
        auto numbers = decoder.extractor().extract(buffer, window);
        for (const auto& candidate : numbers.candidates) {
            std::cout << "[float] @" << candidate.byte_offset << " " << candidate.value << std::endl;
        }
        floats += numbers.candidates.size();
        implausible += numbers.implausible_discarded;
    }

    auto outcome = decoder.decode_buffer(payload.player_name, buffer);
    std::cout << std::setprecision(2);
    for (const auto& record : outcome.records) {
        std::cout << "[record] " << record.category_id() << "-" << record.numeric_id();
        if (record.final_line()) std::cout << " line=" << *record.final_line();
        if (record.top_over_value()) std::cout << " over=" << *record.top_over_value();
        if (record.top_under_value()) std::cout << " under=" << *record.top_under_value();
        std::cout << std::endl;
    }

    std::cout << "[stats] tokens=" << scan.tokens.size()
              << " rejected=" << scan.rejected
              << " floats=" << floats
              << " implausible=" << implausible
              << " records=" << outcome.records.size() << std::endl;
    return 0;
}
