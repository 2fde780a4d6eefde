#pragma once

#include "infrastructure/HotStreakResponseParser.hpp"
#include "services/IPayloadSource.hpp"

#include <string>
#include <vector>

namespace mld::infrastructure {

// Replays GraphQL responses saved to disk. An empty system_path yields an
// empty category table.
class SavedResponseSource : public mld::services::IPayloadSource {
public:
    SavedResponseSource(std::string search_path, std::string system_path = "");

    std::vector<mld::domain::RawPayload> fetch_payloads() override;
    std::vector<mld::domain::CategoryInfo> fetch_categories() override;

    // Throws std::runtime_error if the file cannot be opened.
    static std::string read_file(const std::string& path);

private:
    std::string search_path_;
    std::string system_path_;
    HotStreakResponseParser parser_;
};

} // namespace mld::infrastructure
