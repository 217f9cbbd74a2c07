#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

template <size_t N>
inline void SecureZeroize(std::array<uint8_t, N>* value) noexcept {
  if (value != nullptr) {
    SecureZeroizeMemory(value->data(), value->size());
  }
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  SecureZeroizeMemory(value->data(), value->size());
  value->clear();
}

inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  *value = Scalar();
}

inline void SecureZeroize(std::vector<Scalar>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (Scalar& value : *values) {
    SecureZeroize(&value);
  }
  values->clear();
}

template <typename K>
inline void SecureZeroize(std::map<K, Scalar>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (auto& entry : *values) {
    SecureZeroize(&entry.second);
  }
  values->clear();
}

}  // namespace tdkg
