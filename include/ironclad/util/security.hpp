#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ironclad::util {

/**
 * @brief Utilities for secure handling of sensitive data
 */
class Security {
public:
  /**
   * @brief Compare two strings without leaking where they differ
   *
   * Returns false when the lengths differ. For equal lengths every byte is
   * examined; there is no early exit on the first difference.
   */
  static bool constantTimeEqual(std::string_view a, std::string_view b);

  /**
   * @brief Securely zero out memory containing sensitive data
   * @param data Pointer to sensitive data
   * @param size Size of data in bytes
   */
  static void secureZero(void* data, size_t size);

  /**
   * @brief Clear sensitive string contents securely
   * @param sensitive String containing sensitive data
   */
  static void clearSensitiveString(std::string& sensitive);

private:
  Security() = default;
};

/**
 * @brief RAII wrapper for sensitive strings that auto-clears on destruction
 */
class SensitiveString {
public:
  explicit SensitiveString(std::string value);
  SensitiveString(const SensitiveString&) = delete;
  SensitiveString& operator=(const SensitiveString&) = delete;
  SensitiveString(SensitiveString&& other) noexcept;
  SensitiveString& operator=(SensitiveString&& other) noexcept;
  ~SensitiveString();

  const std::string& value() const { return value_; }
  bool empty() const { return value_.empty(); }
  size_t size() const { return value_.size(); }

  void clear();

private:
  std::string value_;
};

} // namespace ironclad::util
