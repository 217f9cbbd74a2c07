#include "tdkg/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

namespace tdkg {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomScalar() {
  // Rejection sampling keeps the distribution uniform over [0, q).
  while (true) {
    const Bytes bytes = RandomBytes(32);
    try {
      return Scalar::FromCanonicalBytes(bytes);
    } catch (const std::invalid_argument&) {
      continue;
    }
  }
}

Scalar Csprng::RandomNonZeroScalar() {
  while (true) {
    Scalar candidate = RandomScalar();
    if (!candidate.IsZero()) {
      return candidate;
    }
  }
}

}  // namespace tdkg
