#include <gtest/gtest.h>

#include "ironclad/crypto/digest.hpp"
#include "test_helpers.hpp"

using namespace ironclad::crypto;
using ironclad::ErrorCode;

namespace {

const char* kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char* kAbcSha512 =
    "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
    "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f";

}  // namespace

TEST(DigestTest, Sha256KnownVectors) {
  auto hashed = digest("abc");
  ASSERT_OK(hashed);
  EXPECT_EQ(*hashed, kAbcSha256);

  auto empty = digest("");
  ASSERT_OK(empty);
  EXPECT_EQ(*empty, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, Sha512KnownVector) {
  DigestOptions options;
  options.algorithm = DigestAlgorithm::kSha512;
  auto hashed = digest("abc", options);
  ASSERT_OK(hashed);
  EXPECT_EQ(*hashed, kAbcSha512);
  EXPECT_EQ(hashed->size(), 128u);
}

TEST(DigestTest, Base64Encoding) {
  DigestOptions options;
  options.encoding = DigestEncoding::kBase64;
  auto hashed = digest("abc", options);
  ASSERT_OK(hashed);
  EXPECT_EQ(*hashed, "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=");
}

TEST(DigestTest, SaltIsFedBeforeInput) {
  DigestOptions options;
  options.salt = "pepper";
  auto salted = digest("abc", options);
  ASSERT_OK(salted);
  EXPECT_EQ(*salted, "fadf7b97406e1eaa259a82e26e6839e564c37c256876e060e17838c86b7275ef");
  EXPECT_NE(*salted, kAbcSha256);
}

TEST(DigestTest, EmptySaltMatchesUnsalted) {
  DigestOptions options;
  options.salt = "";
  auto hashed = digest("abc", options);
  ASSERT_OK(hashed);
  EXPECT_EQ(*hashed, kAbcSha256);
}

TEST(DigestTest, AlgorithmAndEncodingNames) {
  auto sha512 = parseDigestAlgorithm("sha512");
  ASSERT_OK(sha512);
  EXPECT_EQ(*sha512, DigestAlgorithm::kSha512);
  EXPECT_EQ(digestAlgorithmToString(DigestAlgorithm::kSha256), "sha256");

  EXPECT_ERROR(parseDigestAlgorithm("md5"), ErrorCode::kUnsupportedAlgorithm);
  EXPECT_ERROR(parseDigestAlgorithm("SHA256"), ErrorCode::kUnsupportedAlgorithm);
  EXPECT_ERROR(parseDigestEncoding("base32"), ErrorCode::kInvalidArgument);

  auto md5 = parseDigestAlgorithm("md5");
  ASSERT_FALSE(md5.has_value());
  EXPECT_EQ(md5.error().message(), "Unsupported hashing algorithm: md5");
}

TEST(DigestTest, VerifyDigest) {
  auto match = verifyDigest("abc", kAbcSha256);
  ASSERT_OK(match);
  EXPECT_TRUE(*match);

  auto mismatch = verifyDigest("abd", kAbcSha256);
  ASSERT_OK(mismatch);
  EXPECT_FALSE(*mismatch);

  auto garbage = verifyDigest("abc", "some-incorrect-hash");
  ASSERT_OK(garbage);
  EXPECT_FALSE(*garbage);
}

TEST(DigestTest, VerifyDigestWithSaltAndSha512) {
  DigestOptions options;
  options.algorithm = DigestAlgorithm::kSha512;
  options.salt = "s4lt";

  auto expected = digest("test-comparison", options);
  ASSERT_OK(expected);

  auto match = verifyDigest("test-comparison", *expected, options);
  ASSERT_OK(match);
  EXPECT_TRUE(*match);

  // Same input without the salt must not verify
  options.salt.reset();
  auto unsalted = verifyDigest("test-comparison", *expected, options);
  ASSERT_OK(unsalted);
  EXPECT_FALSE(*unsalted);
}
