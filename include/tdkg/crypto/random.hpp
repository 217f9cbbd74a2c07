#pragma once

#include <cstddef>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static Scalar RandomScalar();
  static Scalar RandomNonZeroScalar();
};

}  // namespace tdkg
