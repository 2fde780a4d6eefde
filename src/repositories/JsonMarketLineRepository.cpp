#include "repositories/JsonMarketLineRepository.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>

using json = nlohmann::json;
using namespace mld::domain;

namespace mld::repositories {

namespace {

template <typename T>
json optional_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

JsonMarketLineRepository::JsonMarketLineRepository(std::string directory)
    : directory_(std::move(directory)) {}

std::string JsonMarketLineRepository::output_path() const {
    return (std::filesystem::path(directory_) / kOutputFile).string();
}

json JsonMarketLineRepository::to_json(const std::vector<JoinedMarketLine>& lines) {
    json out = json::array();
    for (const auto& row : lines) {
        const auto& category = row.category;
        out.push_back({
            {"id", row.id},
            {"market", optional_json(row.market)},
            {"player_name", row.line.player_name},
            {"decimal_odds", optional_json(row.decimal_odds)},
            {"category_id", row.line.category_id},
            {"numeric_id", row.line.numeric_id},
            {"category_name", category ? json(category->name) : json(nullptr)},
            {"group", category ? json(category->group) : json(nullptr)},
            {"sport", category ? json(category->sport) : json(nullptr)},
            {"final_line", optional_json(row.line.final_line)},
            {"top_over_value", optional_json(row.line.top_over_value)},
            {"top_under_value", optional_json(row.line.top_under_value)},
        });
    }
    return out;
}

void JsonMarketLineRepository::write(const std::vector<JoinedMarketLine>& lines) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + directory_ + ": " + ec.message());
    }

    std::ofstream file(output_path());
    if (!file) {
        throw std::runtime_error("Cannot open " + output_path() + " for writing");
    }
    file << to_json(lines).dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("Failed writing " + output_path());
    }
}

} // namespace mld::repositories
