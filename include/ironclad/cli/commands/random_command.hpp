#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"

namespace ironclad::cli {

/**
 * @brief Generate a random string from a named charset
 * Usage: ironclad random [--length N] [--charset alphanumeric|numeric|hex]
 */
class RandomCommand : public Command {
public:
  explicit RandomCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "random"; }
  std::string description() const override { return "Generate a random string"; }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  size_t length_ = 0;
  std::string charset_;
  CLI::Option* length_option_ = nullptr;
};

} // namespace ironclad::cli
