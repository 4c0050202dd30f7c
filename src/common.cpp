#include "ironclad/common.hpp"

#include <sstream>

#ifndef IRONCLAD_VERSION_MAJOR
#define IRONCLAD_VERSION_MAJOR 0
#define IRONCLAD_VERSION_MINOR 1
#define IRONCLAD_VERSION_PATCH 0
#endif

namespace ironclad {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFilePermissionDenied:
      return "File permission denied";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kRegexError:
      return "Regex error";
    case ErrorCode::kMaskingError:
      return "Masking error";
    case ErrorCode::kUnsupportedAlgorithm:
      return "Unsupported algorithm";
    case ErrorCode::kCryptoError:
      return "Crypto error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef IRONCLAD_VERSION_BUILD
  return Version{IRONCLAD_VERSION_MAJOR, IRONCLAD_VERSION_MINOR, IRONCLAD_VERSION_PATCH,
                 IRONCLAD_VERSION_BUILD};
#else
  return Version{IRONCLAD_VERSION_MAJOR, IRONCLAD_VERSION_MINOR, IRONCLAD_VERSION_PATCH, ""};
#endif
}

}  // namespace ironclad
