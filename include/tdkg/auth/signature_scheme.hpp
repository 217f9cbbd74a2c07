#pragma once

#include <span>

#include "tdkg/common/bytes.hpp"
#include "tdkg/protocol/types.hpp"

namespace tdkg {

class ISignatureScheme {
 public:
  virtual ~ISignatureScheme() = default;

  // Throws on failure.
  virtual Bytes Sign(const PrivateKey& private_key, std::span<const uint8_t> message) const = 0;
  virtual bool Verify(const PublicKey& public_key,
                      std::span<const uint8_t> message,
                      std::span<const uint8_t> signature) const = 0;
};

// Schnorr signatures over secp256k1. A signature is the compressed nonce
// commitment R followed by the 32 byte response s, with s*G == R + e*P and
// e = H(R, P, message).
class SchnorrSignatureScheme : public ISignatureScheme {
 public:
  static constexpr size_t kSignatureSize = ECPoint::kCompressedSize + 32;

  Bytes Sign(const PrivateKey& private_key, std::span<const uint8_t> message) const override;
  bool Verify(const PublicKey& public_key,
              std::span<const uint8_t> message,
              std::span<const uint8_t> signature) const override;
};

}  // namespace tdkg
