#include "services/PayloadDecodeService.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using namespace mld::domain;
using mld::decoder::DecodeOutcome;

namespace mld::services {

PayloadDecodeService::PayloadDecodeService(const mld::decoder::MarketPayloadDecoder& decoder,
                                           int worker_threads,
                                           std::ostream& log)
    : decoder_(decoder)
    , worker_threads_(0)
    , log_(log) {
    if (worker_threads < 1) {
        throw std::invalid_argument(
            "worker_threads must be at least 1, got: " + std::to_string(worker_threads));
    }
    worker_threads_ = static_cast<std::size_t>(worker_threads);
}

BatchResult PayloadDecodeService::decode_batch(const std::vector<RawPayload>& payloads) const {
    BatchResult result;
    result.outcomes = decode_all(payloads);

    for (const auto& outcome : result.outcomes) {
        result.totals += outcome.diagnostics;

        if (outcome.error) {
            log_ << "[decoder] " << outcome.player_name << ": "
                 << to_string(outcome.error->stage) << " stage failed: "
                 << outcome.error->reason << std::endl;
            result.errors.push_back(*outcome.error);
            continue;
        }

        for (const auto& record : outcome.records) {
            result.lines.push_back(PlayerMarketLine{
                outcome.player_name,
                record.category_id(),
                record.numeric_id(),
                record.final_line(),
                record.top_over_value(),
                record.top_under_value(),
            });
        }
    }
    return result;
}

std::vector<DecodeOutcome> PayloadDecodeService::decode_all(
    const std::vector<RawPayload>& payloads) const {
    std::vector<DecodeOutcome> outcomes(payloads.size());

    std::size_t workers = std::min(worker_threads_, payloads.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < payloads.size(); ++i) {
            outcomes[i] = decoder_.decode(payloads[i]);
        }
        return outcomes;
    }

    // Each worker claims indices and writes only its own slots
    std::atomic<std::size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto work = [&]() {
        try {
            for (std::size_t i = next++; i < payloads.size(); i = next++) {
                outcomes[i] = decoder_.decode(payloads[i]);
            }
        } catch (...) {
            std::lock_guard lock(failure_mutex);
            if (!failure) failure = std::current_exception();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (std::size_t w = 0; w < workers; ++w) {
            threads.push_back(start_worker(work));
        }
    } catch (...) {
        // Workers already running still reference this frame
        next = payloads.size();
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        throw;
    }
    for (auto& t : threads) {
        t.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return outcomes;
}

std::thread PayloadDecodeService::start_worker(std::function<void()> work) const {
    return std::thread(std::move(work));
}

} // namespace mld::services
