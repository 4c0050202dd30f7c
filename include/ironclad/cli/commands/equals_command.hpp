#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"

namespace ironclad::cli {

// ironclad equals <a> <b>
class EqualsCommand : public Command {
public:
  explicit EqualsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "equals"; }
  std::string description() const override { return "Compare two strings in constant time"; }

  void setupCommand(CLI::App* cmd) override;

private:
  std::string left_;
  std::string right_;
};

} // namespace ironclad::cli
