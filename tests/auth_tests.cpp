#include <functional>
#include <iostream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "tdkg/auth/authenticator.hpp"
#include "tdkg/auth/signature_scheme.hpp"
#include "tdkg/crypto/random.hpp"
#include "tdkg/net/envelope.hpp"

namespace {

using tdkg::AuthDealBundle;
using tdkg::AuthJustificationBundle;
using tdkg::AuthResponseBundle;
using tdkg::Bytes;
using tdkg::Csprng;
using tdkg::DealBundle;
using tdkg::ECPoint;
using tdkg::JustificationBundle;
using tdkg::Node;
using tdkg::NullAuthenticator;
using tdkg::PrivateKey;
using tdkg::ResponseBundle;
using tdkg::Roster;
using tdkg::RosterAuthenticator;
using tdkg::Scalar;
using tdkg::SchnorrSignatureScheme;
using tdkg::SignedEnvelope;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

struct Identity {
  PrivateKey private_key;
  Node node;
};

Identity MakeIdentity(tdkg::PartyIndex index) {
  Identity out;
  out.private_key = Csprng::RandomNonZeroScalar();
  out.node = Node{.index = index, .public_key = ECPoint::GeneratorMultiply(out.private_key)};
  return out;
}

DealBundle MakeDeal(tdkg::PartyIndex dealer) {
  DealBundle bundle;
  bundle.dealer_index = dealer;
  bundle.public_coefficients.push_back(ECPoint::GeneratorMultiply(Scalar::FromUint64(11)));
  bundle.deals.push_back(tdkg::Deal{.share_index = 0,
                                    .ephemeral_key = ECPoint::GeneratorMultiply(Scalar::FromUint64(5)),
                                    .encrypted_share = Bytes(32, 0xAB)});
  bundle.session_id = Bytes{1, 2, 3};
  return bundle;
}

ResponseBundle MakeResponse(tdkg::PartyIndex share_index) {
  ResponseBundle bundle;
  bundle.share_index = share_index;
  bundle.responses.push_back(
      tdkg::Response{.dealer_index = 0, .status = tdkg::ResponseStatus::kComplaint});
  bundle.session_id = Bytes{1, 2, 3};
  return bundle;
}

JustificationBundle MakeJustification(tdkg::PartyIndex dealer) {
  JustificationBundle bundle;
  bundle.dealer_index = dealer;
  bundle.justifications.push_back(
      tdkg::Justification{.share_index = 2, .share = Scalar::FromUint64(99)});
  bundle.session_id = Bytes{1, 2, 3};
  return bundle;
}

void TestSchnorrSignVerify() {
  const SchnorrSignatureScheme scheme;
  const Identity alice = MakeIdentity(0);
  const Identity bob = MakeIdentity(1);
  const Bytes message = {'h', 'e', 'l', 'l', 'o'};

  const Bytes signature = scheme.Sign(alice.private_key, message);
  Expect(signature.size() == SchnorrSignatureScheme::kSignatureSize, "signature size");
  Expect(scheme.Verify(alice.node.public_key, message, signature), "valid signature verifies");
  Expect(!scheme.Verify(bob.node.public_key, message, signature), "wrong key rejects");

  Bytes other_message = message;
  other_message[0] = 'j';
  Expect(!scheme.Verify(alice.node.public_key, other_message, signature),
         "modified message rejects");

  Bytes flipped = signature;
  flipped.back() ^= 0x01;
  Expect(!scheme.Verify(alice.node.public_key, message, flipped), "modified s rejects");

  Bytes bad_nonce = signature;
  bad_nonce[0] = 0x07;
  Expect(!scheme.Verify(alice.node.public_key, message, bad_nonce),
         "unparseable nonce commitment rejects without throwing");

  Expect(!scheme.Verify(alice.node.public_key, message, Bytes{}), "empty signature rejects");
  ExpectThrow([&]() { (void)scheme.Sign(Scalar(), message); }, "zero private key cannot sign");
}

void TestBundleDigestsAreStableAndContentBound() {
  const DealBundle deal = MakeDeal(3);
  Expect(deal.Hash() == MakeDeal(3).Hash(), "deal digest is deterministic");
  Expect(deal.Hash() != MakeDeal(4).Hash(), "deal digest covers the dealer index");

  DealBundle altered = deal;
  altered.deals[0].encrypted_share[5] ^= 0x01;
  Expect(deal.Hash() != altered.Hash(), "deal digest covers the encrypted shares");

  ResponseBundle response = MakeResponse(1);
  ResponseBundle approving = response;
  approving.responses[0].status = tdkg::ResponseStatus::kSuccess;
  Expect(response.Hash() != approving.Hash(), "response digest covers the status");

  JustificationBundle justification = MakeJustification(0);
  JustificationBundle other_share = justification;
  other_share.justifications[0].share = Scalar::FromUint64(100);
  Expect(justification.Hash() != other_share.Hash(), "justification digest covers the share");

  Expect(deal.Hash().size() == 32 && response.Hash().size() == 32, "digests are 32 bytes");
}

void TestNullAuthenticatorAcceptsEverything() {
  const NullAuthenticator auth;
  const std::vector<SignedEnvelope> envelopes = {
      AuthDealBundle{.bundle = MakeDeal(42), .signature = {}},
      AuthResponseBundle{.bundle = MakeResponse(7), .signature = Bytes{1, 2}},
      AuthJustificationBundle{.bundle = MakeJustification(1000), .signature = Bytes(64, 0xFF)},
  };
  for (const SignedEnvelope& envelope : envelopes) {
    std::string error;
    Expect(auth.Verify(envelope, &error), "null authenticator accepts every envelope");
    Expect(error.empty(), "null authenticator reports no error");
  }
  Expect(auth.Sign(MakeDeal(0)).empty(), "null authenticator attaches empty signatures");
  Expect(auth.Sign(MakeResponse(0)).empty(), "null authenticator response signature");
  Expect(auth.Sign(MakeJustification(0)).empty(), "null authenticator justification signature");
}

void TestRosterAuthenticatorUsesPerKindRoster() {
  auto scheme = std::make_shared<SchnorrSignatureScheme>();
  const Identity old0 = MakeIdentity(0);
  const Identity old1 = MakeIdentity(1);
  const Identity new5 = MakeIdentity(5);

  const Roster old_roster({old0.node, old1.node});
  const Roster new_roster({new5.node});

  const RosterAuthenticator as_old1(scheme, old_roster, new_roster, old1.private_key);
  const RosterAuthenticator as_new5(scheme, old_roster, new_roster, new5.private_key);

  std::string error;

  const DealBundle deal = MakeDeal(1);
  AuthDealBundle signed_deal{.bundle = deal, .signature = as_old1.Sign(deal)};
  Expect(!signed_deal.signature.empty(), "configured scheme attaches a signature");
  Expect(as_new5.Verify(signed_deal, &error), "deal from an old roster dealer verifies");

  const ResponseBundle response = MakeResponse(5);
  AuthResponseBundle signed_response{.bundle = response, .signature = as_new5.Sign(response)};
  Expect(as_old1.Verify(signed_response, &error), "response resolves in the new roster");

  // Index 1 exists only in the old roster, so a response from it is unknown.
  const ResponseBundle stray_response = MakeResponse(1);
  AuthResponseBundle signed_stray{.bundle = stray_response,
                                  .signature = as_old1.Sign(stray_response)};
  Expect(!as_new5.Verify(signed_stray, &error), "response sender outside the new roster drops");
  Expect(!error.empty(), "roster miss carries a reason");

  // Index 5 exists only in the new roster, so a deal from it is unknown.
  const DealBundle stray_deal = MakeDeal(5);
  AuthDealBundle signed_stray_deal{.bundle = stray_deal, .signature = as_new5.Sign(stray_deal)};
  Expect(!as_old1.Verify(signed_stray_deal, &error), "deal sender outside the old roster drops");

  const JustificationBundle justification = MakeJustification(0);
  AuthJustificationBundle forged{.bundle = justification,
                                 .signature = as_old1.Sign(justification)};
  error.clear();
  Expect(!as_new5.Verify(forged, &error), "justification signed by another member drops");
  Expect(error.find("signature") != std::string::npos, "signature mismatch reason");

  AuthDealBundle tampered = signed_deal;
  tampered.bundle.public_coefficients[0] = ECPoint::GeneratorMultiply(Scalar::FromUint64(12));
  Expect(!as_new5.Verify(tampered, &error), "bundle modified after signing drops");

  AuthDealBundle unsigned_deal{.bundle = deal, .signature = {}};
  Expect(!as_new5.Verify(unsigned_deal, &error), "missing signature drops");
}

class ThrowingVerifyScheme : public tdkg::ISignatureScheme {
 public:
  Bytes Sign(const PrivateKey&, std::span<const uint8_t>) const override { return Bytes{0x01}; }
  bool Verify(const tdkg::PublicKey&,
              std::span<const uint8_t>,
              std::span<const uint8_t>) const override {
    throw std::runtime_error("malformed signature encoding");
  }
};

void TestRosterAuthenticatorRejectsThrowingVerifier() {
  const Identity self = MakeIdentity(0);
  const RosterAuthenticator auth(std::make_shared<ThrowingVerifyScheme>(), Roster({self.node}),
                                 Roster(), self.private_key);

  const DealBundle deal = MakeDeal(0);
  AuthDealBundle envelope{.bundle = deal, .signature = auth.Sign(deal)};
  std::string error;
  Expect(!auth.Verify(envelope, &error), "verifier exception rejects the envelope");
  Expect(error.find("malformed signature encoding") != std::string::npos,
         "rejection carries the verifier error");
}

void TestMakeAuthenticator() {
  const Identity self = MakeIdentity(0);
  const Roster roster({self.node});

  auto null_auth = tdkg::MakeAuthenticator(nullptr, roster, Roster(), self.private_key);
  Expect(dynamic_cast<NullAuthenticator*>(null_auth.get()) != nullptr,
         "no scheme selects the null authenticator");

  auto scheme = std::make_shared<SchnorrSignatureScheme>();
  auto roster_auth = tdkg::MakeAuthenticator(scheme, roster, Roster(), self.private_key);
  Expect(dynamic_cast<RosterAuthenticator*>(roster_auth.get()) != nullptr,
         "a scheme selects the roster authenticator");

  // An empty new roster stands for the old one.
  const ResponseBundle response = MakeResponse(0);
  AuthResponseBundle signed_response{.bundle = response,
                                     .signature = roster_auth->Sign(response)};
  std::string error;
  Expect(roster_auth->Verify(signed_response, &error), "empty new roster falls back to old");

  ExpectThrow([&]() { (void)RosterAuthenticator(scheme, Roster(), Roster(), self.private_key); },
              "roster authenticator needs an old roster");
  ExpectThrow([]() { (void)Roster({Node{.index = 1}, Node{.index = 1}}); },
              "roster rejects duplicate indices");
}

}  // namespace

int main() {
  try {
    TestSchnorrSignVerify();
    TestBundleDigestsAreStableAndContentBound();
    TestNullAuthenticatorAcceptsEverything();
    TestRosterAuthenticatorUsesPerKindRoster();
    TestRosterAuthenticatorRejectsThrowingVerifier();
    TestMakeAuthenticator();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "auth tests passed" << '\n';
  return 0;
}
