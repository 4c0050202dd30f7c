#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"

namespace ironclad::cli {

/**
 * @brief Mask a single string
 * Usage: ironclad mask <text> [-s START] [-e END] [-l low|medium|high] [-m CHAR]
 *
 * Options that are not given come from the [mask] section of the config.
 */
class MaskCommand : public Command {
public:
  explicit MaskCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "mask"; }
  std::string description() const override { return "Mask a string securely"; }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string text_;
  size_t visible_start_ = 0;
  size_t visible_end_ = 0;
  std::string sensitivity_;
  std::string mask_char_;

  CLI::Option* start_option_ = nullptr;
  CLI::Option* end_option_ = nullptr;
};

} // namespace ironclad::cli
