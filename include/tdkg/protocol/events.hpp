#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "tdkg/net/envelope.hpp"
#include "tdkg/protocol/phase.hpp"

namespace tdkg {

enum class ProtocolEventType : uint32_t {
  kPhaseStarted = 1,
  kPhaseCompleted = 2,
  kBundleSent = 3,
  kEnvelopeAccepted = 4,
  kEnvelopeDropped = 5,
  kTerminated = 6,
};

const char* ToString(ProtocolEventType type);

struct ProtocolEvent {
  ProtocolEventType type = ProtocolEventType::kPhaseStarted;
  std::optional<Phase> phase;
  std::optional<EnvelopeKind> kind;
  PartyIndex sender = 0;
  bool success = true;
  std::string detail;
};

// Called on the thread running Protocol::Start(). Hooks must not throw and
// must not block.
using EventHook = std::function<void(const ProtocolEvent& event)>;

std::string Describe(const ProtocolEvent& event);

// Forwards events to Logger::Instance(): drops as warnings, failed
// terminations as errors, everything else at debug or info level.
EventHook MakeLoggingEventHook(std::string component);

}  // namespace tdkg
