#pragma once

#include <filesystem>
#include <string>

namespace ironclad::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/ironclad)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/ironclad)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get log directory (~/.local/share/ironclad/logs)
  static std::filesystem::path logDir();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace ironclad::util
