#include "ironclad/cli/commands/generate_salt_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ironclad/crypto/random.hpp"

namespace ironclad::cli {

GenerateSaltCommand::GenerateSaltCommand(Application& app) : app_(app) {
}

void GenerateSaltCommand::setupCommand(CLI::App* cmd) {
  length_option_ = cmd->add_option("-l,--length", length_,
                                   "Salt length in bytes (default: random.salt_length, 16)")
                       ->check(CLI::PositiveNumber);
}

Result<int> GenerateSaltCommand::execute(const GlobalOptions& options) {
  const size_t length = length_option_->count() > 0 ? length_ : app_.config().random.salt_length;

  auto salt = crypto::Random::salt(length);
  if (!salt.has_value()) {
    return std::unexpected(salt.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["length"] = length;
    result["salt"] = *salt;
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << "Generated Salt: " << *salt << std::endl;
  }

  return 0;
}

} // namespace ironclad::cli
