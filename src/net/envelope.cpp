#include "tdkg/net/envelope.hpp"

namespace tdkg {

EnvelopeKind KindOf(const SignedEnvelope& envelope) {
  return std::visit([](const auto& typed) { return typed.kKind; }, envelope);
}

PartyIndex SenderOf(const SignedEnvelope& envelope) {
  return std::visit([](const auto& typed) { return typed.bundle.sender_index(); }, envelope);
}

const char* ToString(EnvelopeKind kind) {
  switch (kind) {
    case EnvelopeKind::kDeal:
      return "deal";
    case EnvelopeKind::kResponse:
      return "response";
    case EnvelopeKind::kJustification:
      return "justification";
  }
  return "unknown";
}

}  // namespace tdkg
