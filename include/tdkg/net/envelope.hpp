#pragma once

#include <cstdint>
#include <variant>

#include "tdkg/common/bytes.hpp"
#include "tdkg/protocol/bundles.hpp"

namespace tdkg {

enum class EnvelopeKind : uint32_t {
  kDeal = 1,
  kResponse = 2,
  kJustification = 3,
};

// Generation whose roster resolves the sender index of an envelope.
enum class RosterKind : uint32_t {
  kOld = 0,
  kNew = 1,
};

// Bundles travel with a detached signature over bundle.Hash(). The signature
// is empty iff the run has no authentication scheme.
struct AuthDealBundle {
  static constexpr EnvelopeKind kKind = EnvelopeKind::kDeal;
  static constexpr RosterKind kSenderRoster = RosterKind::kOld;

  DealBundle bundle;
  Bytes signature;
};

struct AuthResponseBundle {
  static constexpr EnvelopeKind kKind = EnvelopeKind::kResponse;
  static constexpr RosterKind kSenderRoster = RosterKind::kNew;

  ResponseBundle bundle;
  Bytes signature;
};

struct AuthJustificationBundle {
  static constexpr EnvelopeKind kKind = EnvelopeKind::kJustification;
  static constexpr RosterKind kSenderRoster = RosterKind::kOld;

  JustificationBundle bundle;
  Bytes signature;
};

using SignedEnvelope =
    std::variant<AuthDealBundle, AuthResponseBundle, AuthJustificationBundle>;

EnvelopeKind KindOf(const SignedEnvelope& envelope);
PartyIndex SenderOf(const SignedEnvelope& envelope);
const char* ToString(EnvelopeKind kind);

}  // namespace tdkg
