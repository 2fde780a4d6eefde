#include "config/Settings.hpp"
#include "decoder/MarketPayloadDecoder.hpp"
#include "infrastructure/HotStreakClient.hpp"
#include "infrastructure/SavedResponseSource.hpp"
#include "repositories/IMarketLineRepository.hpp"
#include "repositories/JsonMarketLineRepository.hpp"
#include "services/MarketLinePipeline.hpp"
#include "services/PayloadDecodeService.hpp"

#ifdef MLD_HAS_ARROW
#include "repositories/arrow/ArrowMarketLineRepository.hpp"
#endif

#include <ixwebsocket/IXNetSystem.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::unique_ptr<mld::repositories::IMarketLineRepository> make_repository(
    const mld::config::OutputSettings& output) {
    if (output.format == "json") {
        return std::make_unique<mld::repositories::JsonMarketLineRepository>(output.directory);
    }
#ifdef MLD_HAS_ARROW
    namespace afs = mld::repositories::arrowfs;
    return std::make_unique<afs::ArrowMarketLineRepository>(
        afs::ArrowMarketLineRepository::make_local_fs(output.directory),
        afs::table_format_from_string(output.format));
#else
    std::cerr << "[output] " << output.format << " output requested but not compiled in. "
              << "Rebuild with Apache Arrow installed." << std::endl;
    return nullptr;
#endif
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: market_line_decoder [search.json [system.json]]" << std::endl;
        std::cerr << "       Without arguments, fetches live data from MLD_GRAPHQL_URL." << std::endl;
        return 1;
    }

    auto settings = mld::config::Settings::from_environment();
    try {
        settings.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[engine] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    auto repo = make_repository(settings.output);
    if (!repo) {
        return 1;
    }

    ix::initNetSystem();

    std::unique_ptr<mld::services::IPayloadSource> source;
    if (argc >= 2) {
        source = std::make_unique<mld::infrastructure::SavedResponseSource>(
            argv[1], argc >= 3 ? argv[2] : "");
        std::cout << "[engine] Replaying saved responses from " << argv[1] << std::endl;
    } else {
        if (settings.api.id_token.empty()) {
            std::cerr << "[engine] MLD_ID_TOKEN is not set; the API may reject requests."
                      << std::endl;
        }
        source = std::make_unique<mld::infrastructure::HotStreakClient>(settings.api);
        std::cout << "[engine] Fetching from " << settings.api.graphql_url << std::endl;
    }

    int status = 0;
    try {
        mld::decoder::MarketPayloadDecoder decoder(settings.decoder);
        mld::services::PayloadDecodeService decode_service(
            decoder, settings.service.worker_threads);
        mld::services::MarketLinePipeline pipeline(*source, *repo, decode_service);

        auto stats = pipeline.run();

        std::cout << "[output] Wrote " << stats.lines << " lines as "
                  << settings.output.format << " to " << settings.output.directory << std::endl;
        std::cout << "[stats] players=" << stats.players
                  << " lines=" << stats.lines
                  << " matched=" << stats.matched
                  << " categories=" << stats.categories
                  << " errors=" << stats.errors
                  << " tokens_rejected=" << stats.diagnostics.tokens_rejected
                  << " implausible_discarded=" << stats.diagnostics.implausible_discarded
                  << " dropped_empty=" << stats.diagnostics.records_dropped_empty
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[engine] Failed: " << e.what() << std::endl;
        status = 1;
    }

    ix::uninitNetSystem();
    if (status == 0) {
        std::cout << "[engine] Done." << std::endl;
    }
    return status;
}
