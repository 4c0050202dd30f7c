#include "ironclad/cli/commands/random_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ironclad/crypto/random.hpp"

namespace ironclad::cli {

RandomCommand::RandomCommand(Application& app) : app_(app) {
}

void RandomCommand::setupCommand(CLI::App* cmd) {
  length_option_ = cmd->add_option("-l,--length", length_, "Length of the string (default: 16)")
                       ->check(CLI::PositiveNumber);
  cmd->add_option("-c,--charset", charset_,
                  "Character set (alphanumeric, numeric, hex, default: alphanumeric)");
}

Result<int> RandomCommand::execute(const GlobalOptions& options) {
  const auto& config = app_.config();
  const size_t length = length_option_->count() > 0 ? length_ : config.random.length;
  const auto charset = crypto::parseCharset(charset_.empty() ? config.random.charset : charset_);

  auto value = crypto::Random::string(length, charset);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["length"] = length;
    result["charset"] = crypto::charsetToString(charset);
    result["value"] = *value;
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << "Generated Random String: " << *value << std::endl;
  }

  return 0;
}

} // namespace ironclad::cli
