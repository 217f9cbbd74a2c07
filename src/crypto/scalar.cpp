#include "tdkg/crypto/scalar.hpp"

#include <stdexcept>

namespace tdkg {
namespace {

const mpz_class kGroupOrder(
    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

mpz_class ReduceModQ(const mpz_class& input) {
  mpz_class reduced = input % kGroupOrder;
  if (reduced < 0) {
    reduced += kGroupOrder;
  }
  return reduced;
}

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::invalid_argument("scalar bytes must not be empty");
  }

  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(ReduceModQ(value)) {}

Scalar Scalar::FromUint64(uint64_t value) {
  mpz_class out;
  mpz_import(out.get_mpz_t(), 1, 1, sizeof(value), 0, 0, &value);
  return Scalar(out);
}

Scalar Scalar::FromBigEndianModQ(std::span<const uint8_t> bytes) {
  return Scalar(ImportBigEndian(bytes));
}

Scalar Scalar::FromCanonicalBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw std::invalid_argument("canonical scalar must be 32 bytes");
  }

  const mpz_class imported = ImportBigEndian(bytes);
  if (imported >= kGroupOrder) {
    throw std::invalid_argument("canonical scalar is not reduced mod q");
  }
  return Scalar(imported);
}

std::array<uint8_t, 32> Scalar::ToCanonicalBytes() const {
  std::array<uint8_t, 32> out{};
  if (value_ == 0) {
    return out;
  }

  const size_t byte_len = (mpz_sizeinbase(value_.get_mpz_t(), 2) + 7) / 8;
  if (byte_len > out.size()) {
    throw std::runtime_error("scalar does not fit in 32 bytes");
  }

  size_t written = 0;
  mpz_export(out.data() + (out.size() - byte_len), &written, 1, sizeof(uint8_t), 1, 0,
             value_.get_mpz_t());
  return out;
}

const mpz_class& Scalar::value() const {
  return value_;
}

bool Scalar::IsZero() const {
  return value_ == 0;
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator-(const Scalar& other) const {
  return Scalar(value_ - other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

Scalar& Scalar::operator+=(const Scalar& other) {
  value_ = ReduceModQ(value_ + other.value_);
  return *this;
}

Scalar& Scalar::operator*=(const Scalar& other) {
  value_ = ReduceModQ(value_ * other.value_);
  return *this;
}

Scalar Scalar::Inverse() const {
  if (IsZero()) {
    throw std::domain_error("zero scalar has no inverse");
  }

  mpz_class inverse;
  if (mpz_invert(inverse.get_mpz_t(), value_.get_mpz_t(), kGroupOrder.get_mpz_t()) == 0) {
    throw std::domain_error("scalar is not invertible mod q");
  }
  return Scalar(inverse);
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusQ() {
  return kGroupOrder;
}

}  // namespace tdkg
