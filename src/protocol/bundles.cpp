#include "tdkg/protocol/bundles.hpp"

#include "tdkg/crypto/transcript.hpp"

namespace tdkg {
namespace {

constexpr char kDealBundleDomain[] = "tdkg/deal-bundle/v1";
constexpr char kResponseBundleDomain[] = "tdkg/response-bundle/v1";
constexpr char kJustificationBundleDomain[] = "tdkg/justification-bundle/v1";

}  // namespace

Bytes DealBundle::Hash() const {
  Transcript transcript(kDealBundleDomain);
  transcript.append_u32_be("dealer_index", dealer_index);
  transcript.append_u32_be("deal_count", static_cast<uint32_t>(deals.size()));
  for (const Deal& deal : deals) {
    transcript.append_u32_be("share_index", deal.share_index);
    transcript.append_point("ephemeral_key", deal.ephemeral_key);
    transcript.append("encrypted_share", deal.encrypted_share);
  }
  transcript.append_u32_be("coefficient_count",
                           static_cast<uint32_t>(public_coefficients.size()));
  for (const ECPoint& coefficient : public_coefficients) {
    transcript.append_point("coefficient", coefficient);
  }
  transcript.append("session_id", session_id);
  return transcript.digest();
}

Bytes ResponseBundle::Hash() const {
  Transcript transcript(kResponseBundleDomain);
  transcript.append_u32_be("share_index", share_index);
  transcript.append_u32_be("response_count", static_cast<uint32_t>(responses.size()));
  for (const Response& response : responses) {
    transcript.append_u32_be("dealer_index", response.dealer_index);
    transcript.append_u32_be("status", static_cast<uint32_t>(response.status));
  }
  transcript.append("session_id", session_id);
  return transcript.digest();
}

Bytes JustificationBundle::Hash() const {
  Transcript transcript(kJustificationBundleDomain);
  transcript.append_u32_be("dealer_index", dealer_index);
  transcript.append_u32_be("justification_count",
                           static_cast<uint32_t>(justifications.size()));
  for (const Justification& justification : justifications) {
    transcript.append_u32_be("share_index", justification.share_index);
    transcript.append_scalar("share", justification.share);
  }
  transcript.append("session_id", session_id);
  return transcript.digest();
}

}  // namespace tdkg
