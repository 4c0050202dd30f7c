#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ironclad/common.hpp"

namespace ironclad::crypto {

enum class DigestAlgorithm {
  kSha256,
  kSha512
};

enum class DigestEncoding {
  kHex,
  kBase64
};

// kUnsupportedAlgorithm for anything but "sha256" / "sha512"
Result<DigestAlgorithm> parseDigestAlgorithm(std::string_view name);
std::string digestAlgorithmToString(DigestAlgorithm algorithm);

// kInvalidArgument for anything but "hex" / "base64"
Result<DigestEncoding> parseDigestEncoding(std::string_view name);
std::string digestEncodingToString(DigestEncoding encoding);

struct DigestOptions {
  DigestAlgorithm algorithm = DigestAlgorithm::kSha256;
  DigestEncoding encoding = DigestEncoding::kHex;
  std::optional<std::string> salt;  // Fed to the hash before the input when set
};

/**
 * @brief Compute a (optionally salted) SHA-2 digest of input
 * @return Encoded digest, or kCryptoError if OpenSSL fails
 */
Result<std::string> digest(std::string_view input, const DigestOptions& options = {});

/**
 * @brief Recompute the digest of input and compare it to expected in constant time
 * @return true on match; errors only when the digest itself cannot be computed
 */
Result<bool> verifyDigest(std::string_view input, std::string_view expected,
                          const DigestOptions& options = {});

}  // namespace ironclad::crypto
