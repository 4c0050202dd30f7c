#pragma once

#include <string>

#include "ironclad/util/error_handler.hpp"
#include "ironclad/cli/application.hpp"

namespace ironclad::cli {

// Command-specific error handler that formats errors for CLI output
class CommandErrorHandler {
public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Display the error, log it and return the exit code for its severity
  int handleCommandError(const util::ContextualError& error);

  int handleError(const Error& error, const std::string& operation = "");

  // Attach a severity (and operation, if any) to a library error
  util::ContextualError toContextualError(const Error& error, const std::string& operation = "");

private:
  const GlobalOptions& options_;

  void logError(const util::ContextualError& error);
  bool useColor() const;
};

} // namespace ironclad::cli
