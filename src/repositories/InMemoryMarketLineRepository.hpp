#pragma once

#include "repositories/IMarketLineRepository.hpp"

#include <cstddef>
#include <vector>

namespace mld::repositories {

class InMemoryMarketLineRepository : public mld::repositories::IMarketLineRepository {
public:
    void write(const std::vector<mld::domain::JoinedMarketLine>& lines) override {
        lines_.insert(lines_.end(), lines.begin(), lines.end());
        ++write_count_;
    }

    // Test helpers
    const std::vector<mld::domain::JoinedMarketLine>& lines() const { return lines_; }
    std::size_t write_count() const { return write_count_; }

private:
    std::vector<mld::domain::JoinedMarketLine> lines_;
    std::size_t write_count_{0};
};

} // namespace mld::repositories
