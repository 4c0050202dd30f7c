#include "ironclad/cli/commands/hash_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ironclad/crypto/digest.hpp"
#include "ironclad/util/security.hpp"

namespace ironclad::cli {

HashCommand::HashCommand(Application& app) : app_(app) {
}

void HashCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", text_, "String to hash")->required();
  cmd->add_option("-a,--algorithm", algorithm_, "Hashing algorithm (sha256, sha512)");
  cmd->add_option("-e,--encoding", encoding_, "Output encoding (hex, base64)");
  salt_option_ = cmd->add_option("-s,--salt", salt_, "Salt for hashing");
}

Result<int> HashCommand::execute(const GlobalOptions& options) {
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

  auto hashed = crypto::digest(secret.value(), digest_options);
  if (!hashed.has_value()) {
    return std::unexpected(hashed.error());
  }

  const auto algorithm_name = crypto::digestAlgorithmToString(*algorithm);
  if (options.json) {
    nlohmann::json result;
    result["algorithm"] = algorithm_name;
    result["encoding"] = crypto::digestEncodingToString(*encoding);
    result["salted"] = digest_options.salt.has_value();
    result["digest"] = *hashed;
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << "Hashed string (" << algorithm_name << "): " << *hashed << std::endl;
  }

  return 0;
}

} // namespace ironclad::cli
