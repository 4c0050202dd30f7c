#include "ironclad/cli/commands/equals_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ironclad/util/security.hpp"

namespace ironclad::cli {

EqualsCommand::EqualsCommand(Application& /*app*/) {
}

void EqualsCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("a", left_, "First string")->required();
  cmd->add_option("b", right_, "Second string")->required();
}

Result<int> EqualsCommand::execute(const GlobalOptions& options) {
  const bool equal = util::Security::constantTimeEqual(left_, right_);

  if (options.json) {
    nlohmann::json result;
    result["equal"] = equal;
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << "Equal: " << (equal ? "true" : "false") << std::endl;
  }

  return 0;
}

} // namespace ironclad::cli
