#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"

namespace ironclad::cli {

/**
 * @brief Print a hex salt of N random bytes
 * Usage: ironclad generate-salt [--length N]
 */
class GenerateSaltCommand : public Command {
public:
  explicit GenerateSaltCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "generate-salt"; }
  std::string description() const override {
    return "Generate a cryptographically secure random salt";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  size_t length_ = 0;
  CLI::Option* length_option_ = nullptr;
};

} // namespace ironclad::cli
