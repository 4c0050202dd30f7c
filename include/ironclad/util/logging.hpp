#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace ironclad::util {

struct LoggingOptions {
  spdlog::level::level_enum console_level = spdlog::level::warn;
  bool file_enabled = false;
  std::filesystem::path file_path;  // Empty means Xdg::logDir()/ironclad.log
  bool color = true;
};

// Unknown names map to warn
spdlog::level::level_enum parseLogLevel(std::string_view name);

// Raise console level by verbosity count: 1 -> info, 2+ -> debug
spdlog::level::level_enum levelForVerbosity(spdlog::level::level_enum base, int verbose);

/**
 * @brief Install the "ironclad" default logger and hook it into ErrorHandler
 *
 * Console output goes to stderr. A rotating file sink is added when enabled;
 * if it cannot be created the logger stays console-only and a warning is
 * emitted. Safe to call more than once (the logger is replaced).
 */
void setupLogging(const LoggingOptions& options);

} // namespace ironclad::util
