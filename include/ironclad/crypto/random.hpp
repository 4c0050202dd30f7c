#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ironclad/common.hpp"

namespace ironclad::crypto {

enum class Charset {
  kAlphanumeric,  // A-Z a-z 0-9
  kNumeric,       // 0-9
  kHex            // 0-9 a-f
};

// Unrecognized names fall back to Charset::kAlphanumeric
Charset parseCharset(std::string_view name);
std::string charsetToString(Charset charset);
std::string_view charsetAlphabet(Charset charset);

inline constexpr size_t kDefaultSaltLength = 16;

/**
 * @brief Cryptographically secure random generation backed by getrandom(2)
 */
class Random {
public:
  /**
   * @brief Fill a buffer with random bytes
   * @return kSystemError if the kernel entropy source fails
   */
  static Result<std::vector<uint8_t>> bytes(size_t count);

  /**
   * @brief Uniform integer in [0, bound) without modulo bias
   * @return kInvalidArgument when bound is 0
   */
  static Result<uint32_t> uniformInt(uint32_t bound);

  /**
   * @brief Random string drawn from a character set
   * @param length Number of characters, must be positive
   */
  static Result<std::string> string(size_t length, Charset charset = Charset::kAlphanumeric);

  /**
   * @brief Random salt rendered as lowercase hex (2 characters per byte)
   * @param length Number of random bytes, must be positive
   */
  static Result<std::string> salt(size_t length = kDefaultSaltLength);

private:
  Random() = default;
};

}  // namespace ironclad::crypto
