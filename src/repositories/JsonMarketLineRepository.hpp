#pragma once

#include "repositories/IMarketLineRepository.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mld::repositories {

// Writes <directory>/market_lines.json as a single array of objects.
class JsonMarketLineRepository : public mld::repositories::IMarketLineRepository {
public:
    explicit JsonMarketLineRepository(std::string directory);

    void write(const std::vector<mld::domain::JoinedMarketLine>& lines) override;

    std::string output_path() const;

    // Absent optionals serialize as null.
    static nlohmann::json to_json(const std::vector<mld::domain::JoinedMarketLine>& lines);

private:
    std::string directory_;

    static constexpr const char* kOutputFile = "market_lines.json";
};

} // namespace mld::repositories
