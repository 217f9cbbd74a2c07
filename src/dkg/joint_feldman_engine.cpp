#include "tdkg/dkg/joint_feldman_engine.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

#include "tdkg/common/secure_zeroize.hpp"
#include "tdkg/crypto/random.hpp"
#include "tdkg/crypto/transcript.hpp"

namespace tdkg {
namespace {

constexpr size_t kEncryptedShareLen = 32;
constexpr char kShareEncryptionDomain[] = "tdkg/joint-feldman/share-pad/v1";

Scalar ShareAbscissa(PartyIndex share_index) {
  return Scalar::FromUint64(static_cast<uint64_t>(share_index) + 1);
}

Roster BuildRosterOrThrow(const DkgConfig& cfg) {
  if (cfg.old_nodes.empty()) {
    throw std::invalid_argument("key generation requires at least one node");
  }

  Roster roster(cfg.old_nodes);
  if (!cfg.new_nodes.empty() && !(Roster(cfg.new_nodes) == roster)) {
    throw std::invalid_argument(
        "JointFeldmanEngine runs fresh key generation only: new_nodes must match old_nodes");
  }
  return roster;
}

bool VerifyShare(const std::vector<ECPoint>& commitments,
                 PartyIndex share_index,
                 const Scalar& share) {
  try {
    return ECPoint::GeneratorMultiply(share) == EvaluatePublicPolynomial(commitments, share_index);
  } catch (const std::invalid_argument&) {
    return false;
  }
}

}  // namespace

JointFeldmanEngine::JointFeldmanEngine(DkgConfig cfg)
    : longterm_(std::move(cfg.longterm)),
      roster_(BuildRosterOrThrow(cfg)),
      threshold_(cfg.threshold),
      nonce_(std::move(cfg.nonce)) {
  if (threshold_ == 0 || threshold_ > roster_.size()) {
    throw std::invalid_argument("threshold must be in [1, " + std::to_string(roster_.size()) +
                                "]");
  }
  if (nonce_.empty()) {
    throw std::invalid_argument("nonce must not be empty");
  }
  if (longterm_.IsZero()) {
    throw std::invalid_argument("longterm key must be non-zero");
  }

  const std::optional<PartyIndex> index = roster_.IndexOf(ECPoint::GeneratorMultiply(longterm_));
  if (!index.has_value()) {
    throw std::invalid_argument("longterm key does not belong to any roster node");
  }
  index_ = *index;
}

JointFeldmanEngine::~JointFeldmanEngine() {
  SecureZeroize(&coefficients_);
  SecureZeroize(&shares_);
  SecureZeroize(&longterm_);
}

bool JointFeldmanEngine::CanIssue() const {
  return true;
}

PartyIndex JointFeldmanEngine::index() const {
  return index_;
}

uint32_t JointFeldmanEngine::threshold() const {
  return threshold_;
}

DealBundle JointFeldmanEngine::Deals() {
  EnsureLocalPolynomialPrepared();

  DealBundle bundle;
  bundle.dealer_index = index_;
  bundle.public_coefficients = public_coefficients_;
  bundle.session_id = nonce_;
  for (const Node& node : roster_.nodes()) {
    bundle.deals.push_back(
        EncryptShare(node.index, node.public_key, EvaluateLocalPolynomial(node.index)));
  }
  return bundle;
}

std::optional<ResponseBundle> JointFeldmanEngine::ProcessDeals(
    const std::vector<DealBundle>& deals) {
  EnsureLocalPolynomialPrepared();

  for (const DealBundle& bundle : deals) {
    const PartyIndex dealer = bundle.dealer_index;
    if (bundle.session_id != nonce_ || !roster_.Contains(dealer) || dealer == index_) {
      continue;
    }
    if (dealer_commitments_.count(dealer) != 0) {
      continue;
    }
    if (bundle.public_coefficients.size() != threshold_) {
      continue;
    }
    dealer_commitments_[dealer] = bundle.public_coefficients;

    for (const Deal& deal : bundle.deals) {
      if (deal.share_index != index_) {
        continue;
      }
      const std::optional<Scalar> share = DecryptShare(dealer, deal);
      if (share.has_value() && VerifyShare(bundle.public_coefficients, index_, *share)) {
        shares_[dealer] = *share;
      }
      break;
    }
  }

  ResponseBundle response;
  response.share_index = index_;
  response.session_id = nonce_;
  for (PartyIndex dealer : roster_.indices()) {
    if (shares_.count(dealer) != 0) {
      continue;
    }
    complaints_[dealer].insert(index_);
    response.responses.push_back(
        Response{.dealer_index = dealer, .status = ResponseStatus::kComplaint});
  }

  if (response.responses.empty()) {
    return std::nullopt;
  }
  return response;
}

ResponseProcessing JointFeldmanEngine::ProcessResponses(
    const std::vector<ResponseBundle>& responses) {
  for (const ResponseBundle& bundle : responses) {
    if (bundle.session_id != nonce_ || !roster_.Contains(bundle.share_index)) {
      continue;
    }
    for (const Response& response : bundle.responses) {
      if (response.status == ResponseStatus::kComplaint && roster_.Contains(response.dealer_index)) {
        complaints_[response.dealer_index].insert(bundle.share_index);
      }
    }
  }

  ResponseProcessing out;
  if (!HasUnresolvedComplaints()) {
    out.result = ComputeResult();
    return out;
  }

  const auto against_self = complaints_.find(index_);
  if (against_self == complaints_.end() || against_self->second.empty()) {
    return out;
  }

  JustificationBundle justification;
  justification.dealer_index = index_;
  justification.session_id = nonce_;
  for (PartyIndex complainer : against_self->second) {
    justification.justifications.push_back(
        Justification{.share_index = complainer, .share = EvaluateLocalPolynomial(complainer)});
  }
  // The revealed shares are consistent with our own commitments.
  against_self->second.clear();
  out.justification = std::move(justification);
  return out;
}

DkgResult JointFeldmanEngine::ProcessJustifications(
    const std::vector<JustificationBundle>& justifications) {
  for (const JustificationBundle& bundle : justifications) {
    const PartyIndex dealer = bundle.dealer_index;
    if (bundle.session_id != nonce_ || !roster_.Contains(dealer)) {
      continue;
    }
    const auto commitments = dealer_commitments_.find(dealer);
    if (commitments == dealer_commitments_.end()) {
      continue;
    }

    std::set<PartyIndex>& open = complaints_[dealer];
    for (const Justification& justification : bundle.justifications) {
      if (open.count(justification.share_index) == 0) {
        continue;
      }
      if (!VerifyShare(commitments->second, justification.share_index, justification.share)) {
        continue;
      }
      open.erase(justification.share_index);
      if (justification.share_index == index_) {
        shares_[dealer] = justification.share;
      }
    }
  }

  return ComputeResult();
}

void JointFeldmanEngine::EnsureLocalPolynomialPrepared() {
  if (!coefficients_.empty()) {
    return;
  }

  coefficients_.reserve(threshold_);
  public_coefficients_.reserve(threshold_);
  for (uint32_t k = 0; k < threshold_; ++k) {
    coefficients_.push_back(Csprng::RandomNonZeroScalar());
    public_coefficients_.push_back(ECPoint::GeneratorMultiply(coefficients_.back()));
  }

  dealer_commitments_[index_] = public_coefficients_;
  shares_[index_] = EvaluateLocalPolynomial(index_);
}

Scalar JointFeldmanEngine::EvaluateLocalPolynomial(PartyIndex share_index) const {
  if (coefficients_.empty()) {
    throw std::logic_error("local polynomial is not prepared");
  }

  const Scalar x = ShareAbscissa(share_index);
  Scalar acc;
  for (auto it = coefficients_.rbegin(); it != coefficients_.rend(); ++it) {
    acc = (acc * x) + *it;
  }
  return acc;
}

Deal JointFeldmanEngine::EncryptShare(PartyIndex share_index,
                                      const PublicKey& receiver,
                                      const Scalar& share) const {
  const Scalar ephemeral_secret = Csprng::RandomNonZeroScalar();

  Deal deal;
  deal.share_index = share_index;
  deal.ephemeral_key = ECPoint::GeneratorMultiply(ephemeral_secret);

  const Bytes pad =
      DeriveSharePad(receiver.Mul(ephemeral_secret), deal.ephemeral_key, index_, share_index);
  std::array<uint8_t, 32> plaintext = share.ToCanonicalBytes();
  deal.encrypted_share.resize(kEncryptedShareLen);
  for (size_t i = 0; i < kEncryptedShareLen; ++i) {
    deal.encrypted_share[i] = plaintext[i] ^ pad[i];
  }
  SecureZeroize(&plaintext);
  return deal;
}

std::optional<Scalar> JointFeldmanEngine::DecryptShare(PartyIndex dealer_index,
                                                       const Deal& deal) const {
  if (deal.encrypted_share.size() != kEncryptedShareLen) {
    return std::nullopt;
  }

  try {
    const Bytes pad = DeriveSharePad(deal.ephemeral_key.Mul(longterm_), deal.ephemeral_key,
                                     dealer_index, deal.share_index);
    std::array<uint8_t, 32> plaintext{};
    for (size_t i = 0; i < kEncryptedShareLen; ++i) {
      plaintext[i] = deal.encrypted_share[i] ^ pad[i];
    }
    const Scalar share = Scalar::FromCanonicalBytes(plaintext);
    SecureZeroize(&plaintext);
    return share;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

// Every pad is bound to a fresh ephemeral key, so no pad encrypts twice.
Bytes JointFeldmanEngine::DeriveSharePad(const ECPoint& shared_point,
                                         const ECPoint& ephemeral_key,
                                         PartyIndex dealer_index,
                                         PartyIndex share_index) const {
  Transcript transcript(kShareEncryptionDomain);
  transcript.append_point("shared_point", shared_point);
  transcript.append_point("ephemeral_key", ephemeral_key);
  transcript.append("nonce", nonce_);
  transcript.append_u32_be("dealer_index", dealer_index);
  transcript.append_u32_be("share_index", share_index);
  return transcript.digest();
}

bool JointFeldmanEngine::HasUnresolvedComplaints() const {
  for (const auto& entry : complaints_) {
    if (!entry.second.empty()) {
      return true;
    }
  }
  return false;
}

DkgResult JointFeldmanEngine::ComputeResult() const {
  DkgResult result;
  for (PartyIndex dealer : roster_.indices()) {
    const auto open = complaints_.find(dealer);
    if (open != complaints_.end() && !open->second.empty()) {
      continue;
    }
    if (dealer_commitments_.count(dealer) == 0 || shares_.count(dealer) == 0) {
      continue;
    }
    result.qualified.push_back(dealer);
  }

  if (result.qualified.size() < threshold_) {
    throw std::runtime_error("only " + std::to_string(result.qualified.size()) +
                             " qualified dealers, threshold is " + std::to_string(threshold_));
  }

  result.key.share_index = index_;
  for (PartyIndex dealer : result.qualified) {
    result.key.share += shares_.at(dealer);
  }

  for (uint32_t k = 0; k < threshold_; ++k) {
    std::vector<ECPoint> terms;
    terms.reserve(result.qualified.size());
    for (PartyIndex dealer : result.qualified) {
      terms.push_back(dealer_commitments_.at(dealer)[k]);
    }
    result.key.commitments.push_back(ECPoint::Sum(terms));
  }
  return result;
}

ECPoint EvaluatePublicPolynomial(const std::vector<ECPoint>& commitments, PartyIndex share_index) {
  if (commitments.empty()) {
    throw std::invalid_argument("public polynomial has no commitments");
  }

  const Scalar x = ShareAbscissa(share_index);
  Scalar power = Scalar::FromUint64(1);
  std::vector<ECPoint> terms;
  terms.reserve(commitments.size());
  for (const ECPoint& commitment : commitments) {
    terms.push_back(commitment.Mul(power));
    power *= x;
  }
  return ECPoint::Sum(terms);
}

Scalar RecoverSecret(const std::vector<std::pair<PartyIndex, Scalar>>& shares, uint32_t threshold) {
  if (threshold == 0 || shares.size() < threshold) {
    throw std::invalid_argument("not enough shares to recover the secret");
  }

  Scalar secret;
  for (uint32_t i = 0; i < threshold; ++i) {
    const Scalar x_i = ShareAbscissa(shares[i].first);
    Scalar numerator = Scalar::FromUint64(1);
    Scalar denominator = Scalar::FromUint64(1);
    for (uint32_t j = 0; j < threshold; ++j) {
      if (j == i) {
        continue;
      }
      const Scalar x_j = ShareAbscissa(shares[j].first);
      if (x_j == x_i) {
        throw std::invalid_argument("duplicate share index " + std::to_string(shares[j].first));
      }
      numerator *= x_j;
      denominator *= x_j - x_i;
    }
    secret += shares[i].second * numerator * denominator.Inverse();
  }
  return secret;
}

}  // namespace tdkg
