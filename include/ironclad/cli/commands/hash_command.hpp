#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"

namespace ironclad::cli {

/**
 * @brief Hash a string with SHA-256 or SHA-512
 * Usage: ironclad hash <text> [--algorithm sha512] [--encoding base64] [--salt S]
 */
class HashCommand : public Command {
public:
  explicit HashCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "hash"; }
  std::string description() const override { return "Hash a string securely"; }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string text_;
  std::string algorithm_;
  std::string encoding_;
  std::string salt_;
  CLI::Option* salt_option_ = nullptr;
};

} // namespace ironclad::cli
