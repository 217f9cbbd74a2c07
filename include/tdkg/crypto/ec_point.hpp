#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

// Non-identity secp256k1 point held in compressed SEC1 form. Operations whose
// result would be the point at infinity throw std::invalid_argument.
class ECPoint {
 public:
  static constexpr size_t kCompressedSize = 33;

  ECPoint();

  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint GeneratorMultiply(const Scalar& scalar);
  static ECPoint Sum(const std::vector<ECPoint>& points);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;

  Bytes ToCompressedBytes() const;
  const std::array<uint8_t, kCompressedSize>& compressed() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, kCompressedSize> compressed_{};
};

}  // namespace tdkg
