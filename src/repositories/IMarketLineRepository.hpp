#pragma once

#include "domain/records/JoinedMarketLine.hpp"

#include <vector>

namespace mld::repositories {

class IMarketLineRepository {
public:
    // Persists one complete run. Throws std::runtime_error if the sink fails.
    virtual void write(const std::vector<mld::domain::JoinedMarketLine>& lines) = 0;
    virtual ~IMarketLineRepository() = default;
};

} // namespace mld::repositories
