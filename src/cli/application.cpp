#include "ironclad/cli/application.hpp"

#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "ironclad/cli/command_error_handler.hpp"
#include "ironclad/util/logging.hpp"

// Command includes
#include "ironclad/cli/commands/hash_command.hpp"
#include "ironclad/cli/commands/generate_salt_command.hpp"
#include "ironclad/cli/commands/compare_command.hpp"
#include "ironclad/cli/commands/equals_command.hpp"
#include "ironclad/cli/commands/mask_command.hpp"
#include "ironclad/cli/commands/random_command.hpp"
#include "ironclad/cli/commands/redact_command.hpp"
#include "ironclad/cli/commands/bloom_command.hpp"
#include "ironclad/cli/commands/config_command.hpp"

namespace ironclad::cli {

Application::Application()
    : app_("ironclad", "Masking, redaction and hashing toolkit for sensitive data") {

  app_.set_version_flag("--version", ironclad::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (-vv for debug)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored output");
}

void Application::setupCommands() {
  // Hashing and comparison
  registerCommand(std::make_unique<HashCommand>(*this));
  registerCommand(std::make_unique<GenerateSaltCommand>(*this));
  registerCommand(std::make_unique<CompareCommand>(*this));
  registerCommand(std::make_unique<EqualsCommand>(*this));

  // Masking and redaction
  registerCommand(std::make_unique<MaskCommand>(*this));
  registerCommand(std::make_unique<RandomCommand>(*this));
  registerCommand(std::make_unique<RedactCommand>(*this));

  registerCommand(std::make_unique<BloomCommand>(*this));

  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  ironclad hash "my secret" --algorithm sha512 --salt abc123
  ironclad compare "my secret" <digest>
  ironclad mask "1234-5678-9012-3456" -s 4 -e 4 -l high
  ironclad redact -f app.log -r '{"\\d{4}-\\d{4}-\\d{4}-\\d{4}": {"visibleStart": 4, "visibleEnd": 4}}'
  ironclad bloom add --filter seen.json alice@example.com
  ironclad random --length 32 --charset hex

For more information on a specific command, run:
  ironclad <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler error_handler(global_options_);

    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      int code = error_handler.handleError(init_result.error(), "initialize");
      if (code != 0) {
        throw CLI::RuntimeError(code);
      }
      return;
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      int code = error_handler.handleError(result.error(), cmd_ptr->name());
      if (code != 0) {
        throw CLI::RuntimeError(code);
      }
      return;
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (config_.has_value()) {
    return {};
  }

  std::optional<std::filesystem::path> config_path;
  if (!global_options_.config_file.empty()) {
    config_path = global_options_.config_file;
  }

  auto loaded = config::Config::loadFrom(config_path);
  if (!loaded.has_value()) {
    // Still log to stderr so the failure is visible
    util::setupLogging(util::LoggingOptions{.color = !global_options_.no_color});
    return std::unexpected(loaded.error());
  }
  config_ = std::move(*loaded);

  util::LoggingOptions logging;
  logging.console_level = util::levelForVerbosity(util::parseLogLevel(config_->logging.level),
                                                  global_options_.verbose);
  if (global_options_.quiet) {
    logging.console_level = spdlog::level::err;
  }
  logging.file_enabled = config_->logging.file;
  logging.file_path = config_->logging.file_path;
  logging.color = !global_options_.no_color;
  util::setupLogging(logging);

  spdlog::debug("Configuration loaded from {}",
                config_->path().empty() ? std::string("defaults") : config_->path().string());
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!config_.has_value()) {
    throw std::runtime_error("Configuration not initialized");
  }
  return *config_;
}

} // namespace ironclad::cli
