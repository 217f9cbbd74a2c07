#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "tdkg/auth/signature_scheme.hpp"
#include "tdkg/common/bytes.hpp"
#include "tdkg/protocol/types.hpp"

namespace tdkg {

struct DkgConfig {
  PrivateKey longterm;
  // Dealers (and, for a fresh run, receivers).
  std::vector<Node> old_nodes;
  // Receivers of the new generation. Empty means the same as old_nodes.
  std::vector<Node> new_nodes;
  uint32_t threshold = 0;
  // Binds every bundle to one run.
  Bytes nonce;
};

struct ProtocolConfig {
  DkgConfig dkg;
  // Null disables signing and accepts every inbound envelope.
  std::shared_ptr<const ISignatureScheme> auth;
  // Longest wait for the next phase signal. Zero disables the timeout.
  std::chrono::milliseconds phase_timeout{0};
};

}  // namespace tdkg
