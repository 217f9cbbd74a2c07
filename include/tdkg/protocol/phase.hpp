#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace tdkg {

enum class Phase : uint32_t {
  kDeal = 0,
  kResponse = 1,
  kJustification = 2,
  kFinish = 3,
};

constexpr size_t kPhaseCount = 4;

const char* ToString(Phase phase);

// Phase following `phase`, nullopt after kFinish.
std::optional<Phase> NextPhase(Phase phase);

}  // namespace tdkg
