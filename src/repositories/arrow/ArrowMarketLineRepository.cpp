#include "repositories/arrow/ArrowMarketLineRepository.hpp"
#include "repositories/arrow/MarketLineSchemas.hpp"

#include <arrow/csv/api.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>

using namespace mld::domain;

namespace mld::repositories::arrowfs {

namespace {

arrow::Status append_optional(arrow::DoubleBuilder& builder, const std::optional<double>& value) {
    return value ? builder.Append(*value) : builder.AppendNull();
}

arrow::Status append_optional(arrow::StringBuilder& builder,
                              const std::optional<std::string>& value) {
    return value ? builder.Append(*value) : builder.AppendNull();
}

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

} // namespace

TableFormat table_format_from_string(const std::string& str) {
    if (str == "csv") return TableFormat::CSV;
    if (str == "parquet") return TableFormat::PARQUET;
    throw std::invalid_argument("Invalid table format: " + str);
}

ArrowMarketLineRepository::ArrowMarketLineRepository(std::shared_ptr<arrow::fs::FileSystem> fs,
                                                     TableFormat format)
    : fs_(std::move(fs)), format_(format) {
    if (!fs_) {
        throw std::invalid_argument("ArrowMarketLineRepository requires a filesystem");
    }
}

std::shared_ptr<arrow::fs::FileSystem> ArrowMarketLineRepository::make_local_fs(
    const std::string& root_dir) {
    // LocalFileSystem only takes absolute paths
    auto root = std::filesystem::absolute(root_dir).string();
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    check(local->CreateDir(root, /*recursive=*/true), "Cannot create " + root);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root, local);
}

std::string ArrowMarketLineRepository::output_path() const {
    return format_ == TableFormat::CSV ? "market_lines.csv" : "market_lines.parquet";
}

arrow::Result<std::shared_ptr<arrow::Table>> ArrowMarketLineRepository::to_table(
    const std::vector<JoinedMarketLine>& lines) {
    arrow::StringBuilder id_builder, market_builder, player_builder, category_id_builder;
    arrow::StringBuilder name_builder, group_builder, sport_builder;
    arrow::DoubleBuilder odds_builder, line_builder, over_builder, under_builder;
    arrow::UInt64Builder numeric_id_builder;

    for (const auto& row : lines) {
        const auto& category = row.category;
        ARROW_RETURN_NOT_OK(id_builder.Append(row.id));
        ARROW_RETURN_NOT_OK(append_optional(market_builder, row.market));
        ARROW_RETURN_NOT_OK(player_builder.Append(row.line.player_name));
        ARROW_RETURN_NOT_OK(append_optional(odds_builder, row.decimal_odds));
        ARROW_RETURN_NOT_OK(category_id_builder.Append(row.line.category_id));
        ARROW_RETURN_NOT_OK(numeric_id_builder.Append(row.line.numeric_id));
        ARROW_RETURN_NOT_OK(append_optional(name_builder,
            category ? std::optional<std::string>(category->name) : std::nullopt));
        ARROW_RETURN_NOT_OK(append_optional(group_builder,
            category ? std::optional<std::string>(category->group) : std::nullopt));
        ARROW_RETURN_NOT_OK(append_optional(sport_builder,
            category ? std::optional<std::string>(category->sport) : std::nullopt));
        ARROW_RETURN_NOT_OK(append_optional(line_builder, row.line.final_line));
        ARROW_RETURN_NOT_OK(append_optional(over_builder, row.line.top_over_value));
        ARROW_RETURN_NOT_OK(append_optional(under_builder, row.line.top_under_value));
    }

    std::shared_ptr<arrow::Array> arr_id, arr_market, arr_player, arr_odds, arr_cid, arr_nid;
    std::shared_ptr<arrow::Array> arr_name, arr_group, arr_sport, arr_line, arr_over, arr_under;
    ARROW_RETURN_NOT_OK(id_builder.Finish(&arr_id));
    ARROW_RETURN_NOT_OK(market_builder.Finish(&arr_market));
    ARROW_RETURN_NOT_OK(player_builder.Finish(&arr_player));
    ARROW_RETURN_NOT_OK(odds_builder.Finish(&arr_odds));
    ARROW_RETURN_NOT_OK(category_id_builder.Finish(&arr_cid));
    ARROW_RETURN_NOT_OK(numeric_id_builder.Finish(&arr_nid));
    ARROW_RETURN_NOT_OK(name_builder.Finish(&arr_name));
    ARROW_RETURN_NOT_OK(group_builder.Finish(&arr_group));
    ARROW_RETURN_NOT_OK(sport_builder.Finish(&arr_sport));
    ARROW_RETURN_NOT_OK(line_builder.Finish(&arr_line));
    ARROW_RETURN_NOT_OK(over_builder.Finish(&arr_over));
    ARROW_RETURN_NOT_OK(under_builder.Finish(&arr_under));

    return arrow::Table::Make(MarketLineSchemas::market_line_schema(),
        {arr_id, arr_market, arr_player, arr_odds, arr_cid, arr_nid,
         arr_name, arr_group, arr_sport, arr_line, arr_over, arr_under});
}

void ArrowMarketLineRepository::write(const std::vector<JoinedMarketLine>& lines) {
    auto table = to_table(lines);
    check(table.status(), "Cannot build market line table");

    if (format_ == TableFormat::CSV) {
        check(write_csv(**table), "Cannot write " + output_path());
    } else {
        check(write_parquet(**table), "Cannot write " + output_path());
    }
}

arrow::Status ArrowMarketLineRepository::write_csv(const arrow::Table& table) const {
    ARROW_ASSIGN_OR_RAISE(auto outfile, fs_->OpenOutputStream(output_path()));
    ARROW_RETURN_NOT_OK(arrow::csv::WriteCSV(table, arrow::csv::WriteOptions::Defaults(),
                                             outfile.get()));
    return outfile->Close();
}

arrow::Status ArrowMarketLineRepository::write_parquet(const arrow::Table& table) const {
    ARROW_ASSIGN_OR_RAISE(auto outfile, fs_->OpenOutputStream(output_path()));
    int64_t chunk_size = std::max<int64_t>(1, table.num_rows());
    ARROW_RETURN_NOT_OK(::parquet::arrow::WriteTable(table, arrow::default_memory_pool(),
                                                     outfile, chunk_size));
    return outfile->Close();
}

} // namespace mld::repositories::arrowfs
