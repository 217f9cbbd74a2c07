#include "tdkg/protocol/events.hpp"

#include <sstream>
#include <utility>

#include "tdkg/common/logger.hpp"

namespace tdkg {
namespace {

LogLevel LevelFor(const ProtocolEvent& event) {
  switch (event.type) {
    case ProtocolEventType::kEnvelopeDropped:
      return LogLevel::kWarn;
    case ProtocolEventType::kTerminated:
      return event.success ? LogLevel::kInfo : LogLevel::kError;
    case ProtocolEventType::kPhaseStarted:
    case ProtocolEventType::kBundleSent:
      return LogLevel::kInfo;
    case ProtocolEventType::kPhaseCompleted:
    case ProtocolEventType::kEnvelopeAccepted:
      return LogLevel::kDebug;
  }
  return LogLevel::kInfo;
}

}  // namespace

const char* ToString(ProtocolEventType type) {
  switch (type) {
    case ProtocolEventType::kPhaseStarted:
      return "phase started";
    case ProtocolEventType::kPhaseCompleted:
      return "phase completed";
    case ProtocolEventType::kBundleSent:
      return "bundle sent";
    case ProtocolEventType::kEnvelopeAccepted:
      return "envelope accepted";
    case ProtocolEventType::kEnvelopeDropped:
      return "envelope dropped";
    case ProtocolEventType::kTerminated:
      return "terminated";
  }
  return "unknown";
}

std::string Describe(const ProtocolEvent& event) {
  std::ostringstream out;
  out << ToString(event.type);
  if (event.phase.has_value()) {
    out << " phase=" << ToString(*event.phase);
  }
  if (event.kind.has_value()) {
    out << " kind=" << ToString(*event.kind) << " sender=" << event.sender;
  }
  if (event.type == ProtocolEventType::kTerminated) {
    out << (event.success ? " ok" : " failed");
  }
  if (!event.detail.empty()) {
    out << ": " << event.detail;
  }
  return out.str();
}

EventHook MakeLoggingEventHook(std::string component) {
  return [component = std::move(component)](const ProtocolEvent& event) {
    Logger& logger = Logger::Instance();
    const LogLevel level = LevelFor(event);
    if (logger.Enabled(level)) {
      logger.Log(level, component, Describe(event));
    }
  };
}

}  // namespace tdkg
