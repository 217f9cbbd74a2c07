#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "tdkg/protocol/result.hpp"

namespace tdkg {

enum class ProtocolErrorCode : uint32_t {
  kEngineFailed = 1,
  kSigningFailed = 2,
  kCancelled = 3,
  kTimedOut = 4,
  kBroadcastFailed = 5,
};

const char* ToString(ProtocolErrorCode code);

struct ProtocolError {
  ProtocolErrorCode code = ProtocolErrorCode::kEngineFailed;
  std::string message;
};

// Final value of a run: a result or an error, never both.
class ProtocolOutcome {
 public:
  static ProtocolOutcome Success(DkgResult result);
  static ProtocolOutcome Failure(ProtocolErrorCode code, std::string message);

  bool ok() const;

  // Throw std::logic_error when the other alternative is held.
  const DkgResult& result() const;
  const ProtocolError& error() const;

 private:
  explicit ProtocolOutcome(std::variant<DkgResult, ProtocolError> value);

  std::variant<DkgResult, ProtocolError> value_;
};

}  // namespace tdkg
