#pragma once

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "tdkg/protocol/config.hpp"
#include "tdkg/protocol/engine.hpp"

namespace tdkg {

// Pedersen's joint Feldman key generation over secp256k1. Every roster node
// deals a random polynomial of degree threshold-1; shares travel encrypted
// to the receivers' long-term keys and are checked against the dealer's
// public coefficients. Complaints are answered by revealing the disputed
// share, and dealers with unanswered complaints are disqualified.
class JointFeldmanEngine : public IKeyGenEngine {
 public:
  // Throws std::invalid_argument on an unusable configuration.
  explicit JointFeldmanEngine(DkgConfig cfg);
  ~JointFeldmanEngine() override;

  JointFeldmanEngine(const JointFeldmanEngine&) = delete;
  JointFeldmanEngine& operator=(const JointFeldmanEngine&) = delete;

  bool CanIssue() const override;
  DealBundle Deals() override;
  std::optional<ResponseBundle> ProcessDeals(const std::vector<DealBundle>& deals) override;
  ResponseProcessing ProcessResponses(const std::vector<ResponseBundle>& responses) override;
  DkgResult ProcessJustifications(const std::vector<JustificationBundle>& justifications) override;

  PartyIndex index() const;
  uint32_t threshold() const;

 private:
  void EnsureLocalPolynomialPrepared();
  Scalar EvaluateLocalPolynomial(PartyIndex share_index) const;

  Deal EncryptShare(PartyIndex share_index, const PublicKey& receiver, const Scalar& share) const;
  std::optional<Scalar> DecryptShare(PartyIndex dealer_index, const Deal& deal) const;
  Bytes DeriveSharePad(const ECPoint& shared_point,
                       const ECPoint& ephemeral_key,
                       PartyIndex dealer_index,
                       PartyIndex share_index) const;

  bool HasUnresolvedComplaints() const;
  DkgResult ComputeResult() const;

  PrivateKey longterm_;
  Roster roster_;
  PartyIndex index_ = 0;
  uint32_t threshold_ = 0;
  Bytes nonce_;

  std::vector<Scalar> coefficients_;
  std::vector<ECPoint> public_coefficients_;

  // First well-formed deal bundle of every dealer.
  std::map<PartyIndex, std::vector<ECPoint>> dealer_commitments_;
  // Verified share of this node, per dealer.
  std::map<PartyIndex, Scalar> shares_;
  // Dealer -> share indices still complaining about it.
  std::map<PartyIndex, std::set<PartyIndex>> complaints_;
};

// Public commitment to the share at `share_index`: sum of C_k * x^k with
// x = share_index + 1.
ECPoint EvaluatePublicPolynomial(const std::vector<ECPoint>& commitments, PartyIndex share_index);

// Lagrange interpolation at zero over the first `threshold` shares.
Scalar RecoverSecret(const std::vector<std::pair<PartyIndex, Scalar>>& shares, uint32_t threshold);

}  // namespace tdkg
