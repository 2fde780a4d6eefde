#pragma once

#include "domain/payload/RawPayload.hpp"
#include "domain/value_objects/CategoryInfo.hpp"

#include <string>
#include <vector>

namespace mld::infrastructure {

class HotStreakResponseParser {
public:
    // data.search.results[] -> one RawPayload per result carrying markets64.
    // Throws nlohmann::json::parse_error on malformed JSON.
    std::vector<mld::domain::RawPayload> parse_search(const std::string& json_str) const;

    // data.system.sports[].categories[] -> flat category table.
    std::vector<mld::domain::CategoryInfo> parse_system(const std::string& json_str) const;
};

} // namespace mld::infrastructure
