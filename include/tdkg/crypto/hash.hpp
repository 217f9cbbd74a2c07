#pragma once

#include <span>

#include "tdkg/common/bytes.hpp"

namespace tdkg {

Bytes Sha256(std::span<const uint8_t> data);

}  // namespace tdkg
