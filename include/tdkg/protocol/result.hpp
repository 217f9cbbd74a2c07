#pragma once

#include <vector>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/scalar.hpp"
#include "tdkg/protocol/types.hpp"

namespace tdkg {

// Local outcome of a successful key generation: the public polynomial of the
// group and this node's share of its secret.
struct DistKeyShare {
  std::vector<ECPoint> commitments;
  PartyIndex share_index = 0;
  Scalar share;

  const ECPoint& PublicKey() const;
};

struct DkgResult {
  std::vector<PartyIndex> qualified;
  DistKeyShare key;
};

}  // namespace tdkg
