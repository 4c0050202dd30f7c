#pragma once

#include "ironclad/cli/application.hpp"
#include "ironclad/common.hpp"

namespace ironclad::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value
 * - list: List all configuration
 * - path: Show configuration file path
 * - validate: Validate current configuration
 * - init [path]: Write a config file with default values
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "config";
  std::string description_ = "Manage configuration settings";

  // Subcommand flags
  bool get_mode_ = false;
  bool set_mode_ = false;
  bool list_mode_ = false;
  bool path_mode_ = false;
  bool validate_mode_ = false;
  bool init_mode_ = false;

  // Command arguments
  std::string key_;
  std::string value_;
  std::string init_path_;
  bool force_ = false;

  Result<int> executeGet();
  Result<int> executeSet();
  Result<int> executeList();
  Result<int> executePath();
  Result<int> executeValidate();
  Result<int> executeInit();

  std::filesystem::path targetPath() const;
};

}  // namespace ironclad::cli
