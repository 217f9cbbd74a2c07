#pragma once

#include <optional>
#include <vector>

#include "tdkg/protocol/bundles.hpp"
#include "tdkg/protocol/result.hpp"

namespace tdkg {

// On success exactly one member is set, or neither when this node has
// nothing to justify and the run must wait for the finish phase.
struct ResponseProcessing {
  std::optional<DkgResult> result;
  std::optional<JustificationBundle> justification;
};

// Stateful cryptographic core driven by the Protocol once per phase. Every
// method reports failure by throwing; the run then ends with that error.
class IKeyGenEngine {
 public:
  virtual ~IKeyGenEngine() = default;

  // Fixed for the lifetime of the engine.
  virtual bool CanIssue() const = 0;

  virtual DealBundle Deals() = 0;

  // nullopt means there is nothing to broadcast.
  virtual std::optional<ResponseBundle> ProcessDeals(const std::vector<DealBundle>& deals) = 0;

  virtual ResponseProcessing ProcessResponses(const std::vector<ResponseBundle>& responses) = 0;

  virtual DkgResult ProcessJustifications(
      const std::vector<JustificationBundle>& justifications) = 0;
};

}  // namespace tdkg
