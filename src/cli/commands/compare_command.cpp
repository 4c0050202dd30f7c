#include "ironclad/cli/commands/compare_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ironclad/crypto/digest.hpp"
#include "ironclad/util/security.hpp"

namespace ironclad::cli {

CompareCommand::CompareCommand(Application& app) : app_(app) {
}

void CompareCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", text_, "Plain string")->required();
  cmd->add_option("digest", digest_, "Digest to compare against")->required();
  cmd->add_option("-a,--algorithm", algorithm_, "Hashing algorithm (sha256, sha512)");
  cmd->add_option("-e,--encoding", encoding_, "Digest encoding (hex, base64)");
  salt_option_ = cmd->add_option("-s,--salt", salt_, "Salt the digest was made with");
}

Result<int> CompareCommand::execute(const GlobalOptions& options) {
  const auto& config = app_.config();

  // Keep plaintext in wiped buffers only
  util::SensitiveString secret(text_);
  util::SensitiveString salt(salt_);
  util::Security::clearSensitiveString(text_);
  util::Security::clearSensitiveString(salt_);

  auto algorithm = crypto::parseDigestAlgorithm(
      algorithm_.empty() ? config.digest.algorithm : algorithm_);
  if (!algorithm.has_value()) {
    return std::unexpected(algorithm.error());
  }
  auto encoding = crypto::parseDigestEncoding(
      encoding_.empty() ? config.digest.encoding : encoding_);
  if (!encoding.has_value()) {
    return std::unexpected(encoding.error());
  }

  crypto::DigestOptions digest_options;
  digest_options.algorithm = *algorithm;
  digest_options.encoding = *encoding;
  if (salt_option_->count() > 0 && !salt.empty()) {
    digest_options.salt = salt.value();
  }

  auto match = crypto::verifyDigest(secret.value(), digest_, digest_options);
  if (!match.has_value()) {
    return std::unexpected(match.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["algorithm"] = crypto::digestAlgorithmToString(*algorithm);
    result["match"] = *match;
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << "Match: " << (*match ? "true" : "false") << std::endl;
  }

  return 0;
}

} // namespace ironclad::cli
