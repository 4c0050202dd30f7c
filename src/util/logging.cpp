#include "ironclad/util/logging.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "ironclad/util/error_handler.hpp"
#include "ironclad/util/filesystem.hpp"
#include "ironclad/util/xdg.hpp"

namespace ironclad::util {

namespace {

std::string formatErrorForLogging(const ContextualError& error) {
  return fmt::format("[{}:{}] {}", static_cast<int>(error.code()),
                     static_cast<int>(error.severity()), error.fullDescription());
}

void logContextualError(const ContextualError& error) {
  auto message = formatErrorForLogging(error);

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      spdlog::info(message);
      break;
    case ErrorSeverity::kWarning:
      spdlog::warn(message);
      break;
    case ErrorSeverity::kError:
      spdlog::error(message);
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical(message);
      break;
  }
}

}  // namespace

spdlog::level::level_enum parseLogLevel(std::string_view name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return spdlog::level::warn;
}

spdlog::level::level_enum levelForVerbosity(spdlog::level::level_enum base, int verbose) {
  if (verbose >= 2) return std::min(base, spdlog::level::debug);
  if (verbose == 1) return std::min(base, spdlog::level::info);
  return base;
}

void setupLogging(const LoggingOptions& options) {
  std::vector<spdlog::sink_ptr> sinks;

  spdlog::sink_ptr console_sink;
  if (options.color) {
    console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    console_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
  }
  console_sink->set_level(options.console_level);
  console_sink->set_pattern("[%l] %v");
  sinks.push_back(console_sink);

  std::string file_warning;
  if (options.file_enabled) {
    auto log_file = options.file_path.empty() ? Xdg::logDir() / "ironclad.log" : options.file_path;
    auto log_dir = log_file.parent_path();

    Result<void> dir_ready;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
      dir_ready = FileSystem::createDirectories(log_dir);
    }

    if (!dir_ready.has_value()) {
      file_warning = dir_ready.error().message();
    } else {
      try {
        // 5MB files, 3 backups
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
        sinks.push_back(file_sink);
      } catch (const std::exception& e) {
        file_warning = e.what();
      }
    }
  }

  auto logger = std::make_shared<spdlog::logger>("ironclad", sinks.begin(), sinks.end());
  logger->set_level(options.file_enabled ? spdlog::level::debug : options.console_level);
  spdlog::set_default_logger(logger);

  if (!file_warning.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_warning);
  }

  ErrorHandler::instance().setErrorLogger(logContextualError);
}

} // namespace ironclad::util
