#pragma once

#include <functional>

#include "tdkg/net/envelope.hpp"

namespace tdkg {

using BoardHandler = std::function<void(const SignedEnvelope& envelope)>;

// Broadcast channel shared by every participant of a run. Implementations
// give no ordering, exactly-once or self-filtering guarantees; a node may
// see its own pushes come back. Handlers may be invoked from any thread and
// must not block.
class IBoard {
 public:
  virtual ~IBoard() = default;

  virtual void PushDeal(const AuthDealBundle& deal) = 0;
  virtual void PushResponse(const AuthResponseBundle& response) = 0;
  virtual void PushJustification(const AuthJustificationBundle& justification) = 0;

  virtual void RegisterHandler(BoardHandler handler) = 0;
};

}  // namespace tdkg
