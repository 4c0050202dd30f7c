#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"

namespace ironclad::cli {

/**
 * @brief Check a string against a digest in constant time
 * Usage: ironclad compare <text> <digest> [--algorithm sha512] [--salt S]
 */
class CompareCommand : public Command {
public:
  explicit CompareCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "compare"; }
  std::string description() const override {
    return "Compare a string to a hash securely (SHA-256/SHA-512 only)";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string text_;
  std::string digest_;
  std::string algorithm_;
  std::string encoding_;
  std::string salt_;
  CLI::Option* salt_option_ = nullptr;
};

} // namespace ironclad::cli
