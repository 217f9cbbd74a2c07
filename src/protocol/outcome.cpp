#include "tdkg/protocol/outcome.hpp"

#include <stdexcept>
#include <utility>

namespace tdkg {

const char* ToString(ProtocolErrorCode code) {
  switch (code) {
    case ProtocolErrorCode::kEngineFailed:
      return "engine failed";
    case ProtocolErrorCode::kSigningFailed:
      return "signing failed";
    case ProtocolErrorCode::kCancelled:
      return "cancelled";
    case ProtocolErrorCode::kTimedOut:
      return "timed out";
    case ProtocolErrorCode::kBroadcastFailed:
      return "broadcast failed";
  }
  return "unknown";
}

ProtocolOutcome::ProtocolOutcome(std::variant<DkgResult, ProtocolError> value)
    : value_(std::move(value)) {}

ProtocolOutcome ProtocolOutcome::Success(DkgResult result) {
  return ProtocolOutcome(std::move(result));
}

ProtocolOutcome ProtocolOutcome::Failure(ProtocolErrorCode code, std::string message) {
  return ProtocolOutcome(ProtocolError{.code = code, .message = std::move(message)});
}

bool ProtocolOutcome::ok() const {
  return std::holds_alternative<DkgResult>(value_);
}

const DkgResult& ProtocolOutcome::result() const {
  if (!ok()) {
    throw std::logic_error("protocol outcome holds an error: " +
                           std::get<ProtocolError>(value_).message);
  }
  return std::get<DkgResult>(value_);
}

const ProtocolError& ProtocolOutcome::error() const {
  if (ok()) {
    throw std::logic_error("protocol outcome holds a result");
  }
  return std::get<ProtocolError>(value_);
}

}  // namespace tdkg
