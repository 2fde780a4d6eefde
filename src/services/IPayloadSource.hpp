#pragma once

#include "domain/payload/RawPayload.hpp"
#include "domain/value_objects/CategoryInfo.hpp"

#include <vector>

namespace mld::services {

class IPayloadSource {
public:
    // One entry per participant that reported a markets64 blob.
    virtual std::vector<mld::domain::RawPayload> fetch_payloads() = 0;
    virtual std::vector<mld::domain::CategoryInfo> fetch_categories() = 0;
    virtual ~IPayloadSource() = default;
};

} // namespace mld::services
