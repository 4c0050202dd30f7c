#include "ironclad/util/error_handler.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

namespace ironclad::util {

std::string ContextualError::fullDescription() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;

  if (context_ && !context_->operation.empty()) {
    oss << " (during " << context_->operation << ")";
  }

  return oss.str();
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance_;
  return instance_;
}

void ErrorHandler::report(const ContextualError& error) const {
  if (error_logger_) {
    error_logger_(error);
  }
}

void ErrorHandler::setErrorLogger(std::function<void(const ContextualError&)> logger) {
  error_logger_ = std::move(logger);
}

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format,
                                          bool use_color) const {
  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = static_cast<int>(error.code());
    error_json["kind"] = std::string(errorCodeToString(error.code()));
    error_json["message"] = error.message();
    error_json["severity"] = static_cast<int>(error.severity());

    if (error.context() && !error.context()->operation.empty()) {
      error_json["operation"] = error.context()->operation;
    }

    return error_json.dump();
  }

  std::ostringstream oss;

  const char* color_code = "";
  const char* severity_text = "";
  const char* reset_code = use_color ? "\033[0m" : "";

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      color_code = "\033[36m"; // Cyan
      severity_text = "Info";
      break;
    case ErrorSeverity::kWarning:
      color_code = "\033[33m"; // Yellow
      severity_text = "Warning";
      break;
    case ErrorSeverity::kError:
      color_code = "\033[31m"; // Red
      severity_text = "Error";
      break;
    case ErrorSeverity::kCritical:
      color_code = "\033[35m"; // Magenta
      severity_text = "Critical";
      break;
  }
  if (!use_color) {
    color_code = "";
  }

  oss << color_code << severity_text << reset_code << ": " << error.message();

  if (error.context() && !error.context()->operation.empty()) {
    oss << "\n  Operation: " << error.context()->operation;
  }

  // Add helpful suggestions based on error type
  switch (error.code()) {
    case ErrorCode::kFileNotFound:
      oss << "\n  Suggestion: Check if the file path is correct and the file exists";
      break;
    case ErrorCode::kFilePermissionDenied:
      oss << "\n  Suggestion: Check file permissions or run with appropriate privileges";
      break;
    case ErrorCode::kUnsupportedAlgorithm:
      oss << "\n  Suggestion: Use one of: sha256, sha512";
      break;
    case ErrorCode::kParseError:
      oss << "\n  Suggestion: Rules must be a JSON object such as '{\"\\\\d{4}\": {\"visibleStart\": 1}}'";
      break;
    default:
      break;
  }

  return oss.str();
}

} // namespace ironclad::util
