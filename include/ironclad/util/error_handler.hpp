#pragma once

#include <functional>
#include <optional>
#include <string>

#include "ironclad/common.hpp"

namespace ironclad::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Degraded result, operation continued
  kError,    // Operation failed
  kCritical  // Operation failed and may have left data behind
};

// Error context for providing additional debugging information
struct ErrorContext {
  std::string operation;  // Command or step being performed

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }
};

// Error with context and severity
class ContextualError {
public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  // Get full error description with context
  std::string fullDescription() const;

private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

// Formats errors for users and logs, and forwards them to the installed logger
class ErrorHandler {
public:
  static ErrorHandler& instance();

  // Forward an error to the logger (no-op until one is installed)
  void report(const ContextualError& error) const;

  // Set error logging callback
  void setErrorLogger(std::function<void(const ContextualError&)> logger);

  // Format error for user display
  std::string formatUserError(const ContextualError& error, bool json_format = false,
                              bool use_color = true) const;

private:
  ErrorHandler() = default;
  std::function<void(const ContextualError&)> error_logger_;
};


} // namespace ironclad::util
