#pragma once

#include <cstdint>
#include <vector>

namespace mld::domain {

using ByteBuffer = std::vector<uint8_t>;

} // namespace mld::domain
