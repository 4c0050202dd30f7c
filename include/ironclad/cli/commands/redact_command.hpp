#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"
#include "ironclad/core/redactor.hpp"

namespace ironclad::cli {

/**
 * @brief Redact sensitive data from a file
 * Usage: ironclad redact -f <file> [-r <json> | --rules-file <path>] [-o <output>]
 *
 * Rules come from --rules, then --rules-file, then [[redact.rules]] in the
 * config. The file is overwritten unless --output is given.
 */
class RedactCommand : public Command {
public:
  explicit RedactCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "redact"; }
  std::string description() const override { return "Redact sensitive data from a file"; }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string file_;
  std::string rules_json_;
  std::string rules_file_;
  std::string output_;

  Result<core::RedactionRuleSet> resolveRules();
  void outputResult(const core::RedactionResult& result, const std::string& target,
                    const GlobalOptions& options);
};

} // namespace ironclad::cli
