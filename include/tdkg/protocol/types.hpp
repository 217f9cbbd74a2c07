#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

using PartyIndex = uint32_t;
using PublicKey = ECPoint;
using PrivateKey = Scalar;

struct Node {
  PartyIndex index = 0;
  PublicKey public_key;
};

// Ordered index -> long-term public key mapping of one participant
// generation.
class Roster {
 public:
  Roster() = default;
  explicit Roster(const std::vector<Node>& nodes);

  std::optional<PublicKey> Find(PartyIndex index) const;
  std::optional<PartyIndex> IndexOf(const PublicKey& public_key) const;
  bool Contains(PartyIndex index) const;

  size_t size() const;
  bool empty() const;
  std::vector<PartyIndex> indices() const;
  std::vector<Node> nodes() const;

  bool operator==(const Roster& other) const;

 private:
  std::map<PartyIndex, PublicKey> keys_;
};

}  // namespace tdkg
