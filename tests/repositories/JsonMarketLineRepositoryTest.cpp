#include "repositories/JsonMarketLineRepository.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace mld::domain;
using mld::repositories::JsonMarketLineRepository;
namespace fs = std::filesystem;

namespace {

JoinedMarketLine matched_row() {
    JoinedMarketLine row;
    row.id = "Z2lkOi8vaHMzL0NhdGVnb3J5LzEwMQ-101";
    row.line = PlayerMarketLine{"Jalen Hurts", "Z2lkOi8vaHMzL0NhdGVnb3J5LzEwMQ", 101,
                                24.5, 1.87, 1.95};
    row.category = CategoryInfo{"Z2lkOi8vaHMzL0NhdGVnb3J5LzEwMQ", "Passing Yards",
                                "Passing", "Football"};
    row.market = "passing_yards";
    row.decimal_odds = 1.87;
    return row;
}

JoinedMarketLine unmatched_row() {
    JoinedMarketLine row;
    row.id = "c9-9";
    row.line = PlayerMarketLine{"A.J. Brown", "c9", 9, std::nullopt, std::nullopt, std::nullopt};
    return row;
}

} // namespace

TEST(JsonMarketLineRepository, SerializesAllColumns) {
    auto out = JsonMarketLineRepository::to_json({matched_row()});

    ASSERT_TRUE(out.is_array());
    ASSERT_EQ(out.size(), 1u);
    const auto& obj = out[0];
    EXPECT_EQ(obj["id"], "Z2lkOi8vaHMzL0NhdGVnb3J5LzEwMQ-101");
    EXPECT_EQ(obj["market"], "passing_yards");
    EXPECT_EQ(obj["player_name"], "Jalen Hurts");
    EXPECT_DOUBLE_EQ(obj["decimal_odds"].get<double>(), 1.87);
    EXPECT_EQ(obj["numeric_id"].get<uint64_t>(), 101u);
    EXPECT_EQ(obj["category_name"], "Passing Yards");
    EXPECT_EQ(obj["group"], "Passing");
    EXPECT_EQ(obj["sport"], "Football");
    EXPECT_DOUBLE_EQ(obj["final_line"].get<double>(), 24.5);
    EXPECT_DOUBLE_EQ(obj["top_under_value"].get<double>(), 1.95);
}

TEST(JsonMarketLineRepository, AbsentValuesAreNull) {
    auto obj = JsonMarketLineRepository::to_json({unmatched_row()})[0];

    EXPECT_TRUE(obj["market"].is_null());
    EXPECT_TRUE(obj["category_name"].is_null());
    EXPECT_TRUE(obj["group"].is_null());
    EXPECT_TRUE(obj["sport"].is_null());
    EXPECT_TRUE(obj["decimal_odds"].is_null());
    EXPECT_TRUE(obj["final_line"].is_null());
    EXPECT_TRUE(obj["top_over_value"].is_null());
    EXPECT_TRUE(obj["top_under_value"].is_null());
    EXPECT_EQ(obj["category_id"], "c9");
}

TEST(JsonMarketLineRepository, WritesFileInDirectory) {
    auto dir = fs::temp_directory_path() / "mld_json_repo_test" / "nested";
    fs::remove_all(dir.parent_path());

    JsonMarketLineRepository repo(dir.string());
    repo.write({matched_row(), unmatched_row()});

    ASSERT_TRUE(fs::exists(repo.output_path()));
    std::ifstream in(repo.output_path());
    auto parsed = nlohmann::json::parse(in);
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[1]["player_name"], "A.J. Brown");

    fs::remove_all(dir.parent_path());
}

TEST(JsonMarketLineRepository, EmptyBatchWritesEmptyArray) {
    auto dir = fs::temp_directory_path() / "mld_json_repo_empty";
    JsonMarketLineRepository repo(dir.string());
    repo.write({});

    std::ifstream in(repo.output_path());
    EXPECT_TRUE(nlohmann::json::parse(in).empty());

    fs::remove_all(dir);
}
