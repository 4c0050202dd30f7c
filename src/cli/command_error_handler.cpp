#include "ironclad/cli/command_error_handler.hpp"

#include <iostream>

namespace ironclad::cli {

int CommandErrorHandler::handleCommandError(const util::ContextualError& error) {
  logError(error);

  auto& handler = util::ErrorHandler::instance();
  std::string formatted_error = handler.formatUserError(error, options_.json, useColor());

  if (options_.json) {
    std::cout << formatted_error << std::endl;
  } else {
    std::cerr << formatted_error << std::endl;
  }

  switch (error.severity()) {
    case util::ErrorSeverity::kInfo:
    case util::ErrorSeverity::kWarning:
      return 0;
    case util::ErrorSeverity::kError:
      return 1;
    case util::ErrorSeverity::kCritical:
      return 2;
  }

  return 1;
}

int CommandErrorHandler::handleError(const Error& error, const std::string& operation) {
  return handleCommandError(toContextualError(error, operation));
}

util::ContextualError CommandErrorHandler::toContextualError(const Error& error,
                                                             const std::string& operation) {
  util::ErrorContext context;
  if (!operation.empty()) {
    context.withOperation(operation);
  }

  util::ErrorSeverity severity = util::ErrorSeverity::kError;
  switch (error.code()) {
    case ErrorCode::kFilePermissionDenied:
    case ErrorCode::kCryptoError:
    case ErrorCode::kSystemError:
      severity = util::ErrorSeverity::kCritical;
      break;
    default:
      severity = util::ErrorSeverity::kError;
      break;
  }

  return util::ContextualError(error.code(), error.message(), context, severity);
}

void CommandErrorHandler::logError(const util::ContextualError& error) {
  // JSON output goes to stdout; keep log lines out of it
  if (!options_.json) {
    util::ErrorHandler::instance().report(error);
  }
}

bool CommandErrorHandler::useColor() const {
  return !options_.no_color;
}

} // namespace ironclad::cli
