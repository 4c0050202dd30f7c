#include "ironclad/util/security.hpp"

namespace ironclad::util {

bool Security::constantTimeEqual(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }

  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
  }

  return diff == 0;
}

void Security::secureZero(void* data, size_t size) {
  if (!data || size == 0) {
    return;
  }

  // Use volatile to prevent compiler optimization
  volatile unsigned char* ptr = static_cast<volatile unsigned char*>(data);
  for (size_t i = 0; i < size; ++i) {
    ptr[i] = 0;
  }

  // Memory barrier to prevent reordering
  __asm__ __volatile__("" : : "r"(ptr) : "memory");
}

void Security::clearSensitiveString(std::string& sensitive) {
  if (!sensitive.empty()) {
    secureZero(sensitive.data(), sensitive.size());
    sensitive.clear();
    sensitive.shrink_to_fit();
  }
}

// SensitiveString implementation

SensitiveString::SensitiveString(std::string value) : value_(std::move(value)) {}

SensitiveString::SensitiveString(SensitiveString&& other) noexcept : value_(std::move(other.value_)) {
  other.clear();
}

SensitiveString& SensitiveString::operator=(SensitiveString&& other) noexcept {
  if (this != &other) {
    clear();
    value_ = std::move(other.value_);
    other.clear();
  }
  return *this;
}

SensitiveString::~SensitiveString() {
  clear();
}

void SensitiveString::clear() {
  Security::clearSensitiveString(value_);
}

} // namespace ironclad::util
