#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "guardsig/common/bytes.hpp"
#include "guardsig/crypto/scalar.hpp"

namespace guardsig {

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

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

inline void SecureZeroize(std::string* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  value->Zeroize();
}

inline void SecureZeroize(std::optional<Scalar>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (value->has_value()) {
    SecureZeroize(&value->value());
  }
  value->reset();
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
inline void SecureZeroize(std::unordered_map<K, Scalar>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (auto& [key, value] : *values) {
    (void)key;
    SecureZeroize(&value);
  }
  values->clear();
}

// Owns a value holding key or share material and wipes it on destruction.
// Move-only; a moved-from wrapper holds a wiped value.
template <typename T>
class Zeroizing {
 public:
  Zeroizing() = default;
  explicit Zeroizing(T value) : value_(std::move(value)) {}

  Zeroizing(const Zeroizing&) = delete;
  Zeroizing& operator=(const Zeroizing&) = delete;

  Zeroizing(Zeroizing&& other) noexcept : value_(std::move(other.value_)) {
    SecureZeroize(&other.value_);
  }

  Zeroizing& operator=(Zeroizing&& other) noexcept {
    if (this != &other) {
      SecureZeroize(&value_);
      value_ = std::move(other.value_);
      SecureZeroize(&other.value_);
    }
    return *this;
  }

  ~Zeroizing() { SecureZeroize(&value_); }

  T& get() { return value_; }
  const T& get() const { return value_; }
  T* operator->() { return &value_; }
  const T* operator->() const { return &value_; }

  void Wipe() noexcept { SecureZeroize(&value_); }

 private:
  T value_{};
};

}  // namespace guardsig
