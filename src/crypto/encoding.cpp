#include "ironclad/crypto/encoding.hpp"

#include <openssl/evp.h>

namespace ironclad::crypto {

std::string toHex(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";

  std::string result;
  result.reserve(bytes.size() * 2);
  for (uint8_t byte : bytes) {
    result += kDigits[byte >> 4];
    result += kDigits[byte & 0x0F];
  }
  return result;
}

std::string toBase64(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }

  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL terminator
  std::string result(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()), bytes.data(),
                                static_cast<int>(bytes.size()));
  result.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return result;
}

}  // namespace ironclad::crypto
