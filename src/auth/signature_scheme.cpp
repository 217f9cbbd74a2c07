#include "tdkg/auth/signature_scheme.hpp"

#include <array>
#include <exception>
#include <stdexcept>

#include "tdkg/crypto/random.hpp"
#include "tdkg/crypto/transcript.hpp"

namespace tdkg {
namespace {

constexpr char kSchnorrSignatureDomain[] = "tdkg/schnorr-signature/v1";

Scalar BuildChallenge(const ECPoint& nonce_commitment,
                      const PublicKey& public_key,
                      std::span<const uint8_t> message) {
  Transcript transcript(kSchnorrSignatureDomain);
  transcript.append_point("R", nonce_commitment);
  transcript.append_point("P", public_key);
  transcript.append("message", message);
  return transcript.challenge_scalar_mod_q();
}

}  // namespace

Bytes SchnorrSignatureScheme::Sign(const PrivateKey& private_key,
                                   std::span<const uint8_t> message) const {
  if (private_key.IsZero()) {
    throw std::invalid_argument("schnorr private key must be non-zero");
  }

  const PublicKey public_key = ECPoint::GeneratorMultiply(private_key);
  while (true) {
    const Scalar k = Csprng::RandomNonZeroScalar();
    const ECPoint r = ECPoint::GeneratorMultiply(k);
    const Scalar e = BuildChallenge(r, public_key, message);
    const Scalar s = k + (e * private_key);
    if (s.IsZero()) {
      continue;
    }

    Bytes signature = r.ToCompressedBytes();
    const std::array<uint8_t, 32> s_bytes = s.ToCanonicalBytes();
    signature.insert(signature.end(), s_bytes.begin(), s_bytes.end());
    return signature;
  }
}

bool SchnorrSignatureScheme::Verify(const PublicKey& public_key,
                                    std::span<const uint8_t> message,
                                    std::span<const uint8_t> signature) const {
  if (signature.size() != kSignatureSize) {
    return false;
  }

  try {
    const ECPoint r = ECPoint::FromCompressed(signature.first(ECPoint::kCompressedSize));
    const Scalar s = Scalar::FromCanonicalBytes(signature.subspan(ECPoint::kCompressedSize));
    if (s.IsZero()) {
      return false;
    }

    const Scalar e = BuildChallenge(r, public_key, message);
    const ECPoint lhs = ECPoint::GeneratorMultiply(s);
    ECPoint rhs = r;
    if (!e.IsZero()) {
      rhs = rhs.Add(public_key.Mul(e));
    }
    return lhs == rhs;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace tdkg
