#include "tdkg/crypto/ec_point.hpp"

#include <algorithm>
#include <stdexcept>

extern "C" {
#include <secp256k1.h>
}

namespace tdkg {
namespace {

const secp256k1_context* Context() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created =
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("secp256k1_context_create failed");
    }
    return created;
  }();
  return ctx;
}

secp256k1_pubkey Parse(const std::array<uint8_t, ECPoint::kCompressedSize>& compressed) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(Context(), &pubkey, compressed.data(), compressed.size()) != 1) {
    throw std::invalid_argument("bytes do not encode a secp256k1 point");
  }
  return pubkey;
}

std::array<uint8_t, ECPoint::kCompressedSize> Serialize(const secp256k1_pubkey& pubkey) {
  std::array<uint8_t, ECPoint::kCompressedSize> out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(Context(), out.data(), &out_len, &pubkey,
                                    SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("secp256k1_ec_pubkey_serialize failed");
  }
  return out;
}

}  // namespace

ECPoint::ECPoint() {
  compressed_[0] = 0x02;
}

ECPoint ECPoint::FromCompressed(std::span<const uint8_t> compressed_bytes) {
  if (compressed_bytes.size() != kCompressedSize) {
    throw std::invalid_argument("compressed point must be 33 bytes");
  }

  ECPoint out;
  std::copy(compressed_bytes.begin(), compressed_bytes.end(), out.compressed_.begin());
  (void)Parse(out.compressed_);
  return out;
}

ECPoint ECPoint::GeneratorMultiply(const Scalar& scalar) {
  const std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(Context(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("generator multiplication requires a non-zero scalar");
  }

  ECPoint out;
  out.compressed_ = Serialize(pubkey);
  return out;
}

ECPoint ECPoint::Sum(const std::vector<ECPoint>& points) {
  if (points.empty()) {
    throw std::invalid_argument("cannot sum an empty point list");
  }

  std::vector<secp256k1_pubkey> parsed;
  parsed.reserve(points.size());
  for (const ECPoint& point : points) {
    parsed.push_back(Parse(point.compressed_));
  }
  std::vector<const secp256k1_pubkey*> inputs;
  inputs.reserve(parsed.size());
  for (const secp256k1_pubkey& pubkey : parsed) {
    inputs.push_back(&pubkey);
  }

  secp256k1_pubkey combined;
  if (secp256k1_ec_pubkey_combine(Context(), &combined, inputs.data(), inputs.size()) != 1) {
    throw std::invalid_argument("point sum is the point at infinity");
  }

  ECPoint out;
  out.compressed_ = Serialize(combined);
  return out;
}

ECPoint ECPoint::Add(const ECPoint& other) const {
  return Sum({*this, other});
}

ECPoint ECPoint::Mul(const Scalar& scalar) const {
  secp256k1_pubkey pubkey = Parse(compressed_);
  const std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  if (secp256k1_ec_pubkey_tweak_mul(Context(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("point multiplication requires a non-zero scalar");
  }

  ECPoint out;
  out.compressed_ = Serialize(pubkey);
  return out;
}

Bytes ECPoint::ToCompressedBytes() const {
  return Bytes(compressed_.begin(), compressed_.end());
}

const std::array<uint8_t, ECPoint::kCompressedSize>& ECPoint::compressed() const {
  return compressed_;
}

bool ECPoint::operator==(const ECPoint& other) const {
  return compressed_ == other.compressed_;
}

bool ECPoint::operator!=(const ECPoint& other) const {
  return !(*this == other);
}

}  // namespace tdkg
