#include "tdkg/crypto/transcript.hpp"

#include <array>
#include <stdexcept>

#include "tdkg/crypto/hash.hpp"

namespace tdkg {
namespace {

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

std::span<const uint8_t> AsByteSpan(std::string_view value) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

}  // namespace

Transcript::Transcript(std::string_view domain) {
  append_ascii("domain", domain);
}

void Transcript::append(std::string_view label, std::span<const uint8_t> data) {
  if (label.size() > UINT32_MAX || data.size() > UINT32_MAX) {
    throw std::invalid_argument("transcript field exceeds uint32 length");
  }

  AppendU32Be(static_cast<uint32_t>(label.size()), &transcript_);
  transcript_.insert(transcript_.end(), label.begin(), label.end());

  AppendU32Be(static_cast<uint32_t>(data.size()), &transcript_);
  transcript_.insert(transcript_.end(), data.begin(), data.end());
}

void Transcript::append_ascii(std::string_view label, std::string_view ascii) {
  append(label, AsByteSpan(ascii));
}

void Transcript::append_u32_be(std::string_view label, uint32_t value) {
  Bytes encoded;
  encoded.reserve(4);
  AppendU32Be(value, &encoded);
  append(label, encoded);
}

void Transcript::append_point(std::string_view label, const ECPoint& point) {
  append(label, point.compressed());
}

void Transcript::append_scalar(std::string_view label, const Scalar& scalar) {
  const std::array<uint8_t, 32> encoded = scalar.ToCanonicalBytes();
  append(label, encoded);
}

Bytes Transcript::digest() const {
  return Sha256(transcript_);
}

Scalar Transcript::challenge_scalar_mod_q() const {
  return Scalar::FromBigEndianModQ(digest());
}

const Bytes& Transcript::bytes() const {
  return transcript_;
}

}  // namespace tdkg
