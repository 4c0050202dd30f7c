#include "ironclad/crypto/digest.hpp"

#include <array>
#include <memory>

#include <openssl/evp.h>

#include "ironclad/crypto/encoding.hpp"
#include "ironclad/util/security.hpp"

namespace ironclad::crypto {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

const EVP_MD* evpDigest(DigestAlgorithm algorithm) {
  switch (algorithm) {
    case DigestAlgorithm::kSha256: return EVP_sha256();
    case DigestAlgorithm::kSha512: return EVP_sha512();
  }
  return EVP_sha256();
}

}  // namespace

Result<DigestAlgorithm> parseDigestAlgorithm(std::string_view name) {
  if (name == "sha256") return DigestAlgorithm::kSha256;
  if (name == "sha512") return DigestAlgorithm::kSha512;
  return std::unexpected(makeError(ErrorCode::kUnsupportedAlgorithm,
                                   "Unsupported hashing algorithm: " + std::string(name)));
}

std::string digestAlgorithmToString(DigestAlgorithm algorithm) {
  switch (algorithm) {
    case DigestAlgorithm::kSha256: return "sha256";
    case DigestAlgorithm::kSha512: return "sha512";
  }
  return "sha256";
}

Result<DigestEncoding> parseDigestEncoding(std::string_view name) {
  if (name == "hex") return DigestEncoding::kHex;
  if (name == "base64") return DigestEncoding::kBase64;
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Unsupported digest encoding: " + std::string(name)));
}

std::string digestEncodingToString(DigestEncoding encoding) {
  switch (encoding) {
    case DigestEncoding::kHex: return "hex";
    case DigestEncoding::kBase64: return "base64";
  }
  return "hex";
}

Result<std::string> digest(std::string_view input, const DigestOptions& options) {
  EvpMdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return std::unexpected(makeError(ErrorCode::kCryptoError, "Cannot allocate digest context"));
  }

  if (EVP_DigestInit_ex(ctx.get(), evpDigest(options.algorithm), nullptr) != 1) {
    return std::unexpected(makeError(ErrorCode::kCryptoError, "Digest initialization failed"));
  }

  if (options.salt && !options.salt->empty() &&
      EVP_DigestUpdate(ctx.get(), options.salt->data(), options.salt->size()) != 1) {
    return std::unexpected(makeError(ErrorCode::kCryptoError, "Digest update failed"));
  }

  if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
    return std::unexpected(makeError(ErrorCode::kCryptoError, "Digest update failed"));
  }

  std::array<uint8_t, EVP_MAX_MD_SIZE> buffer{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), buffer.data(), &length) != 1) {
    return std::unexpected(makeError(ErrorCode::kCryptoError, "Digest finalization failed"));
  }

  std::span<const uint8_t> bytes(buffer.data(), length);
  return options.encoding == DigestEncoding::kBase64 ? toBase64(bytes) : toHex(bytes);
}

Result<bool> verifyDigest(std::string_view input, std::string_view expected,
                          const DigestOptions& options) {
  auto computed = digest(input, options);
  if (!computed.has_value()) {
    return std::unexpected(computed.error());
  }
  return util::Security::constantTimeEqual(*computed, expected);
}

}  // namespace ironclad::crypto
