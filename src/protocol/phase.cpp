#include "tdkg/protocol/phase.hpp"

namespace tdkg {

const char* ToString(Phase phase) {
  switch (phase) {
    case Phase::kDeal:
      return "deal";
    case Phase::kResponse:
      return "response";
    case Phase::kJustification:
      return "justification";
    case Phase::kFinish:
      return "finish";
  }
  return "unknown";
}

std::optional<Phase> NextPhase(Phase phase) {
  switch (phase) {
    case Phase::kDeal:
      return Phase::kResponse;
    case Phase::kResponse:
      return Phase::kJustification;
    case Phase::kJustification:
      return Phase::kFinish;
    case Phase::kFinish:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace tdkg
