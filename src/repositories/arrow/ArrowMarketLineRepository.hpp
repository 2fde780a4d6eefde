#pragma once

#include "repositories/IMarketLineRepository.hpp"

#include <arrow/api.h>
#include <arrow/filesystem/api.h>

#include <memory>
#include <string>
#include <vector>

namespace mld::repositories::arrowfs {

enum class TableFormat { CSV, PARQUET };

TableFormat table_format_from_string(const std::string& str);

// Writes market_lines.csv or market_lines.parquet at the root of fs.
class ArrowMarketLineRepository : public mld::repositories::IMarketLineRepository {
public:
    ArrowMarketLineRepository(std::shared_ptr<arrow::fs::FileSystem> fs, TableFormat format);

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    void write(const std::vector<mld::domain::JoinedMarketLine>& lines) override;

    std::string output_path() const;

    static arrow::Result<std::shared_ptr<arrow::Table>> to_table(
        const std::vector<mld::domain::JoinedMarketLine>& lines);

private:
    arrow::Status write_csv(const arrow::Table& table) const;
    arrow::Status write_parquet(const arrow::Table& table) const;

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    TableFormat format_;
};

} // namespace mld::repositories::arrowfs
