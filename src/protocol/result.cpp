#include "tdkg/protocol/result.hpp"

#include <stdexcept>

namespace tdkg {

const ECPoint& DistKeyShare::PublicKey() const {
  if (commitments.empty()) {
    throw std::logic_error("distributed key has no commitments");
  }
  return commitments.front();
}

}  // namespace tdkg
