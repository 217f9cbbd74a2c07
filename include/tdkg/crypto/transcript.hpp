#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

// Injective encoding of labelled fields: every label and value is written
// with a big-endian u32 length prefix, so distinct field sequences never
// collide before hashing.
class Transcript {
 public:
  explicit Transcript(std::string_view domain);

  void append(std::string_view label, std::span<const uint8_t> data);
  void append_ascii(std::string_view label, std::string_view ascii);
  void append_u32_be(std::string_view label, uint32_t value);
  void append_point(std::string_view label, const ECPoint& point);
  void append_scalar(std::string_view label, const Scalar& scalar);

  Bytes digest() const;
  Scalar challenge_scalar_mod_q() const;

  const Bytes& bytes() const;

 private:
  Bytes transcript_;
};

}  // namespace tdkg
