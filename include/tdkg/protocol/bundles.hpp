#pragma once

#include <cstdint>
#include <vector>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/scalar.hpp"
#include "tdkg/protocol/types.hpp"

namespace tdkg {

// Share of one dealer's polynomial, encrypted to the long-term key of the
// node at share_index.
struct Deal {
  PartyIndex share_index = 0;
  ECPoint ephemeral_key;
  Bytes encrypted_share;
};

struct DealBundle {
  PartyIndex dealer_index = 0;
  std::vector<Deal> deals;
  std::vector<ECPoint> public_coefficients;
  Bytes session_id;

  PartyIndex sender_index() const { return dealer_index; }
  Bytes Hash() const;
};

enum class ResponseStatus : uint32_t {
  kSuccess = 0,
  kComplaint = 1,
};

struct Response {
  PartyIndex dealer_index = 0;
  ResponseStatus status = ResponseStatus::kSuccess;
};

struct ResponseBundle {
  PartyIndex share_index = 0;
  std::vector<Response> responses;
  Bytes session_id;

  PartyIndex sender_index() const { return share_index; }
  Bytes Hash() const;
};

// Share revealed in the clear by a dealer answering a complaint.
struct Justification {
  PartyIndex share_index = 0;
  Scalar share;
};

struct JustificationBundle {
  PartyIndex dealer_index = 0;
  std::vector<Justification> justifications;
  Bytes session_id;

  PartyIndex sender_index() const { return dealer_index; }
  Bytes Hash() const;
};

}  // namespace tdkg
