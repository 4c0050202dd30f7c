#include "ironclad/cli/commands/config_command.hpp"

#include <iostream>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace ironclad::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  cmd->description("Manage configuration settings");

  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  auto init_cmd = cmd->add_subcommand("init", "Write a configuration file with default values");
  init_cmd->add_option("path", init_path_, "Where to write it (default: XDG config path)");
  init_cmd->add_flag("--force", force_, "Overwrite an existing file");
  init_cmd->callback([this]() { init_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& /*options*/) {
  if (get_mode_) {
    return executeGet();
  } else if (set_mode_) {
    return executeSet();
  } else if (list_mode_) {
    return executeList();
  } else if (path_mode_) {
    return executePath();
  } else if (validate_mode_) {
    return executeValidate();
  } else if (init_mode_) {
    return executeInit();
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

std::filesystem::path ConfigCommand::targetPath() const {
  const auto& options = app_.globalOptions();
  if (!options.config_file.empty()) {
    return options.config_file;
  }
  return config::Config::defaultConfigPath();
}

Result<int> ConfigCommand::executeGet() {
  auto result = app_.config().get(key_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *result;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *result << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet() {
  auto& config = app_.config();
  auto result = config.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto validation = config.validate();
  if (!validation.has_value()) {
    return std::unexpected(validation.error());
  }

  auto save_result = config.save(targetPath());
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    output["message"] = "Configuration updated successfully";
    std::cout << output.dump(2) << "\n";
  } else if (!app_.globalOptions().quiet) {
    std::cout << "Configuration updated: " << key_ << " = " << value_ << "\n";
  }

  return 0;
}

Result<int> ConfigCommand::executeList() {
  const auto& config = app_.config();

  if (app_.globalOptions().json) {
    nlohmann::ordered_json output;
    for (const auto& key : config::Config::keys()) {
      auto value = config.get(key);
      if (value.has_value()) {
        output[key] = *value;
      }
    }
    auto rules = nlohmann::ordered_json::array();
    for (const auto& rule : config.redact_rules) {
      rules.push_back(rule.pattern);
    }
    output["redact.rules"] = std::move(rules);
    std::cout << output.dump(2) << "\n";
    return 0;
  }

  for (const auto& key : config::Config::keys()) {
    auto value = config.get(key);
    if (value.has_value()) {
      std::cout << key << " = " << *value << "\n";
    }
  }
  for (const auto& rule : config.redact_rules) {
    std::cout << "redact.rules = " << rule.pattern << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath() {
  auto config_path = targetPath();
  std::error_code ec;
  const bool exists = std::filesystem::exists(config_path, ec);

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration file: " << config_path.string() << "\n";
    if (exists) {
      std::cout << "Status: file exists\n";
    } else {
      std::cout << "Status: file not found (using defaults)\n";
    }
  }

  return 0;
}

Result<int> ConfigCommand::executeValidate() {
  auto result = app_.config().validate();
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["valid"] = true;
    output["message"] = "Configuration is valid";
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration is valid\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeInit() {
  std::filesystem::path path = init_path_.empty() ? targetPath() : std::filesystem::path(init_path_);

  std::error_code ec;
  if (std::filesystem::exists(path, ec) && !force_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Config file already exists: " + path.string() +
                                         " (use --force to overwrite)"));
  }

  config::Config defaults;
  auto save_result = defaults.save(path);
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (app_.globalOptions().json) {
    nlohmann::json output;
    output["success"] = true;
    output["config_path"] = path.string();
    std::cout << output.dump(2) << "\n";
  } else if (!app_.globalOptions().quiet) {
    std::cout << "Wrote default configuration to " << path.string() << "\n";
  }
  return 0;
}

}  // namespace ironclad::cli
