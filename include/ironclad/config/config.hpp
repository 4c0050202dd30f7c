#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ironclad/common.hpp"
#include "ironclad/core/mask_config.hpp"
#include "ironclad/core/redactor.hpp"

namespace ironclad::config {

// Configuration for the ironclad application
class Config {
 public:
  Config() = default;

  // Masking defaults for `mask` and for rules that omit a field
  struct MaskSettings {
    size_t visible_start = core::kDefaultVisibleStart;
    size_t visible_end = core::kDefaultVisibleEnd;
    std::string mask_char{core::kDefaultMaskChar};
    std::string sensitivity = "medium";
  };
  MaskSettings mask;

  struct DigestSettings {
    std::string algorithm = "sha256";   // sha256, sha512
    std::string encoding = "hex";       // hex, base64
  };
  DigestSettings digest;

  struct RandomSettings {
    size_t length = 16;
    std::string charset = "alphanumeric";  // alphanumeric, numeric, hex
    size_t salt_length = 16;
  };
  RandomSettings random;

  struct LoggingSettings {
    std::string level = "warn";
    bool file = false;
    std::filesystem::path file_path;  // Empty means the XDG log directory
  };
  LoggingSettings logging;

  // One [[redact.rules]] entry; unset fields fall back to [mask]
  struct RedactRule {
    std::string pattern;
    std::optional<size_t> visible_start;
    std::optional<size_t> visible_end;
    std::optional<std::string> sensitivity;
    std::optional<std::string> mask_char;
  };
  std::vector<RedactRule> redact_rules;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (atomic replace)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set scalar values using dot notation, e.g. "mask.visible_start"
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Every key accepted by get/set, in file order
  static std::vector<std::string> keys();

  // Check names against the supported algorithms, encodings, charsets and
  // levels, and that every redact rule pattern compiles
  Result<void> validate() const;

  // Path last loaded from or saved to (empty if none)
  const std::filesystem::path& path() const { return config_path_; }

  static std::filesystem::path defaultConfigPath();

  // Explicit path must exist; without one a missing default file means defaults
  static Result<Config> loadFrom(const std::optional<std::filesystem::path>& explicit_path);

  core::MaskConfig maskDefaults() const;
  core::RedactionRuleSet redactionRules() const;

 private:
  std::filesystem::path config_path_;

  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace ironclad::config
