#include "ironclad/crypto/random.hpp"

#include <cerrno>
#include <cstring>
#include <limits>

#include <sys/random.h>

#include "ironclad/crypto/encoding.hpp"

namespace ironclad::crypto {

namespace {

constexpr std::string_view kAlphanumeric =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr std::string_view kNumeric = "0123456789";
constexpr std::string_view kHex = "0123456789abcdef";

Result<void> fillRandom(uint8_t* out, size_t count) {
  size_t filled = 0;
  while (filled < count) {
    ssize_t got = getrandom(out + filled, count - filled, 0);
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       std::string("getrandom failed: ") + std::strerror(errno)));
    }
    filled += static_cast<size_t>(got);
  }
  return {};
}

}  // namespace

Charset parseCharset(std::string_view name) {
  if (name == "numeric") return Charset::kNumeric;
  if (name == "hex") return Charset::kHex;
  return Charset::kAlphanumeric;
}

std::string charsetToString(Charset charset) {
  switch (charset) {
    case Charset::kAlphanumeric: return "alphanumeric";
    case Charset::kNumeric: return "numeric";
    case Charset::kHex: return "hex";
  }
  return "alphanumeric";
}

std::string_view charsetAlphabet(Charset charset) {
  switch (charset) {
    case Charset::kAlphanumeric: return kAlphanumeric;
    case Charset::kNumeric: return kNumeric;
    case Charset::kHex: return kHex;
  }
  return kAlphanumeric;
}

Result<std::vector<uint8_t>> Random::bytes(size_t count) {
  std::vector<uint8_t> buffer(count);
  auto result = fillRandom(buffer.data(), buffer.size());
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return buffer;
}

Result<uint32_t> Random::uniformInt(uint32_t bound) {
  if (bound == 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Bound must be positive"));
  }

  // Reject values from the incomplete last block so every residue is equally likely
  const uint32_t limit = std::numeric_limits<uint32_t>::max() -
                         (std::numeric_limits<uint32_t>::max() % bound);
  while (true) {
    uint32_t value = 0;
    auto result = fillRandom(reinterpret_cast<uint8_t*>(&value), sizeof(value));
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    if (value < limit) {
      return value % bound;
    }
  }
}

Result<std::string> Random::string(size_t length, Charset charset) {
  if (length == 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Length must be a positive integer"));
  }

  const auto alphabet = charsetAlphabet(charset);
  std::string result;
  result.reserve(length);

  for (size_t i = 0; i < length; ++i) {
    auto index = uniformInt(static_cast<uint32_t>(alphabet.size()));
    if (!index.has_value()) {
      return std::unexpected(index.error());
    }
    result += alphabet[*index];
  }

  return result;
}

Result<std::string> Random::salt(size_t length) {
  if (length == 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Salt length must be a positive integer"));
  }

  auto buffer = bytes(length);
  if (!buffer.has_value()) {
    return std::unexpected(buffer.error());
  }
  return toHex(*buffer);
}

}  // namespace ironclad::crypto
