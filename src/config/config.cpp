#include "ironclad/config/config.hpp"

#include <array>
#include <charconv>
#include <sstream>

#include <re2/re2.h>
#include <toml++/toml.hpp>

#include "ironclad/crypto/digest.hpp"
#include "ironclad/util/filesystem.hpp"
#include "ironclad/util/xdg.hpp"

namespace ironclad::config {

namespace {

constexpr std::array<std::string_view, 3> kCharsets = {"alphanumeric", "numeric", "hex"};
constexpr std::array<std::string_view, 3> kSensitivities = {"low", "medium", "high"};
constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info", "warn",
                                                        "error", "critical", "off"};

template <size_t N>
bool isOneOf(const std::array<std::string_view, N>& names, std::string_view value) {
  for (auto name : names) {
    if (name == value) return true;
  }
  return false;
}

Result<size_t> readCount(const toml::node_view<toml::node>& node, const std::string& key) {
  auto value = node.value<int64_t>();
  if (!value || *value < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Expected a non-negative integer for " + key));
  }
  return static_cast<size_t>(*value);
}

Result<size_t> parseCount(const std::string& text, const std::string& key) {
  size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid number for " + key + ": " + text));
  }
  return value;
}

Result<bool> parseBool(const std::string& text, const std::string& key) {
  if (text == "true" || text == "1" || text == "yes") return true;
  if (text == "false" || text == "0" || text == "no") return false;
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Invalid boolean for " + key + ": " + text));
}

}  // namespace

Result<Config> Config::loadFrom(const std::optional<std::filesystem::path>& explicit_path) {
  Config config;
  if (explicit_path) {
    auto result = config.load(*explicit_path);
    if (!result) {
      return std::unexpected(result.error());
    }
    return config;
  }

  auto default_path = defaultConfigPath();
  std::error_code ec;
  if (std::filesystem::exists(default_path, ec)) {
    auto result = config.load(default_path);
    if (!result) {
      return std::unexpected(result.error());
    }
  }
  return config;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Mask defaults
    if (config_data["mask"]["visible_start"]) {
      auto value = readCount(config_data["mask"]["visible_start"], "mask.visible_start");
      if (!value) return std::unexpected(value.error());
      mask.visible_start = *value;
    }
    if (config_data["mask"]["visible_end"]) {
      auto value = readCount(config_data["mask"]["visible_end"], "mask.visible_end");
      if (!value) return std::unexpected(value.error());
      mask.visible_end = *value;
    }
    if (auto value = config_data["mask"]["mask_char"].value<std::string>()) {
      mask.mask_char = *value;
    }
    if (auto value = config_data["mask"]["sensitivity"].value<std::string>()) {
      mask.sensitivity = *value;
    }

    // Digest
    if (auto value = config_data["digest"]["algorithm"].value<std::string>()) {
      digest.algorithm = *value;
    }
    if (auto value = config_data["digest"]["encoding"].value<std::string>()) {
      digest.encoding = *value;
    }

    // Random
    if (config_data["random"]["length"]) {
      auto value = readCount(config_data["random"]["length"], "random.length");
      if (!value) return std::unexpected(value.error());
      random.length = *value;
    }
    if (auto value = config_data["random"]["charset"].value<std::string>()) {
      random.charset = *value;
    }
    if (config_data["random"]["salt_length"]) {
      auto value = readCount(config_data["random"]["salt_length"], "random.salt_length");
      if (!value) return std::unexpected(value.error());
      random.salt_length = *value;
    }

    // Logging
    if (auto value = config_data["logging"]["level"].value<std::string>()) {
      logging.level = *value;
    }
    if (auto value = config_data["logging"]["file"].value<bool>()) {
      logging.file = *value;
    }
    if (auto value = config_data["logging"]["file_path"].value<std::string>()) {
      logging.file_path = *value;
    }

    // Redaction rules
    redact_rules.clear();
    if (auto rules = config_data["redact"]["rules"].as_array()) {
      for (size_t i = 0; i < rules->size(); ++i) {
        auto* table = (*rules)[i].as_table();
        auto prefix = "redact.rules[" + std::to_string(i) + "]";
        if (!table) {
          return std::unexpected(makeError(ErrorCode::kConfigError, prefix + " is not a table"));
        }
        toml::node_view<toml::node> rule{&(*rules)[i]};

        RedactRule entry;
        if (auto value = rule["pattern"].value<std::string>()) {
          entry.pattern = *value;
        } else {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           prefix + " is missing a pattern"));
        }
        if (rule["visible_start"]) {
          auto value = readCount(rule["visible_start"], prefix + ".visible_start");
          if (!value) return std::unexpected(value.error());
          entry.visible_start = *value;
        }
        if (rule["visible_end"]) {
          auto value = readCount(rule["visible_end"], prefix + ".visible_end");
          if (!value) return std::unexpected(value.error());
          entry.visible_end = *value;
        }
        if (auto value = rule["sensitivity"].value<std::string>()) {
          entry.sensitivity = *value;
        }
        if (auto value = rule["mask_char"].value<std::string>()) {
          entry.mask_char = *value;
        }
        redact_rules.push_back(std::move(entry));
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    toml::table mask_table;
    mask_table.insert_or_assign("visible_start", static_cast<int64_t>(mask.visible_start));
    mask_table.insert_or_assign("visible_end", static_cast<int64_t>(mask.visible_end));
    mask_table.insert_or_assign("mask_char", mask.mask_char);
    mask_table.insert_or_assign("sensitivity", mask.sensitivity);
    config_data.insert_or_assign("mask", mask_table);

    toml::table digest_table;
    digest_table.insert_or_assign("algorithm", digest.algorithm);
    digest_table.insert_or_assign("encoding", digest.encoding);
    config_data.insert_or_assign("digest", digest_table);

    toml::table random_table;
    random_table.insert_or_assign("length", static_cast<int64_t>(random.length));
    random_table.insert_or_assign("charset", random.charset);
    random_table.insert_or_assign("salt_length", static_cast<int64_t>(random.salt_length));
    config_data.insert_or_assign("random", random_table);

    toml::table logging_table;
    logging_table.insert_or_assign("level", logging.level);
    logging_table.insert_or_assign("file", logging.file);
    if (!logging.file_path.empty()) {
      logging_table.insert_or_assign("file_path", logging.file_path.string());
    }
    config_data.insert_or_assign("logging", logging_table);

    if (!redact_rules.empty()) {
      toml::array rules;
      for (const auto& entry : redact_rules) {
        toml::table rule;
        rule.insert_or_assign("pattern", entry.pattern);
        if (entry.visible_start) {
          rule.insert_or_assign("visible_start", static_cast<int64_t>(*entry.visible_start));
        }
        if (entry.visible_end) {
          rule.insert_or_assign("visible_end", static_cast<int64_t>(*entry.visible_end));
        }
        if (entry.sensitivity) rule.insert_or_assign("sensitivity", *entry.sensitivity);
        if (entry.mask_char) rule.insert_or_assign("mask_char", *entry.mask_char);
        rules.push_back(std::move(rule));
      }
      toml::table redact_table;
      redact_table.insert_or_assign("rules", std::move(rules));
      config_data.insert_or_assign("redact", std::move(redact_table));
    }

    std::stringstream ss;
    ss << config_data << "\n";
    auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
    if (!write_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot write config file: " + write_result.error().message()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

std::vector<std::string> Config::keys() {
  return {"mask.visible_start", "mask.visible_end",  "mask.mask_char",
          "mask.sensitivity",   "digest.algorithm",  "digest.encoding",
          "random.length",      "random.charset",    "random.salt_length",
          "logging.level",      "logging.file",      "logging.file_path"};
}

Result<void> Config::validate() const {
  if (!isOneOf(kSensitivities, mask.sensitivity)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Invalid mask.sensitivity: " + mask.sensitivity));
  }
  if (mask.mask_char.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "mask.mask_char must not be empty"));
  }

  if (auto algorithm = crypto::parseDigestAlgorithm(digest.algorithm); !algorithm) {
    return std::unexpected(makeError(ErrorCode::kValidationError, algorithm.error().message()));
  }
  if (auto encoding = crypto::parseDigestEncoding(digest.encoding); !encoding) {
    return std::unexpected(makeError(ErrorCode::kValidationError, encoding.error().message()));
  }

  if (!isOneOf(kCharsets, random.charset)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Invalid random.charset: " + random.charset));
  }
  if (random.length == 0 || random.salt_length == 0) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "random.length and random.salt_length must be positive"));
  }

  if (!isOneOf(kLogLevels, logging.level)) {
    return std::unexpected(makeError(ErrorCode::kValidationError,
                                     "Invalid logging.level: " + logging.level));
  }

  for (const auto& entry : redact_rules) {
    if (entry.sensitivity && !isOneOf(kSensitivities, *entry.sensitivity)) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "Invalid sensitivity for rule '" + entry.pattern +
                                           "': " + *entry.sensitivity));
    }
    RE2::Options options;
    options.set_log_errors(false);
    RE2 compiled(entry.pattern, options);
    if (!compiled.ok()) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "Invalid redact rule pattern '" + entry.pattern +
                                           "': " + compiled.error()));
    }
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

core::MaskConfig Config::maskDefaults() const {
  core::MaskConfig config;
  config.withVisibleStart(mask.visible_start)
      .withVisibleEnd(mask.visible_end)
      .withMaskChar(mask.mask_char)
      .withSensitivity(core::parseSensitivity(mask.sensitivity));
  return config;
}

core::RedactionRuleSet Config::redactionRules() const {
  core::RedactionRuleSet rules;
  const auto base = maskDefaults();

  for (const auto& entry : redact_rules) {
    auto config = base;
    if (entry.visible_start) config.withVisibleStart(*entry.visible_start);
    if (entry.visible_end) config.withVisibleEnd(*entry.visible_end);
    if (entry.sensitivity) config.withSensitivity(core::parseSensitivity(*entry.sensitivity));
    if (entry.mask_char) config.withMaskChar(*entry.mask_char);
    rules.add(entry.pattern, std::move(config));
  }

  return rules;
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 2) {
    const auto& section = path[0];
    const auto& key = path[1];

    if (section == "mask") {
      if (key == "visible_start") return std::to_string(mask.visible_start);
      if (key == "visible_end") return std::to_string(mask.visible_end);
      if (key == "mask_char") return mask.mask_char;
      if (key == "sensitivity") return mask.sensitivity;
    } else if (section == "digest") {
      if (key == "algorithm") return digest.algorithm;
      if (key == "encoding") return digest.encoding;
    } else if (section == "random") {
      if (key == "length") return std::to_string(random.length);
      if (key == "charset") return random.charset;
      if (key == "salt_length") return std::to_string(random.salt_length);
    } else if (section == "logging") {
      if (key == "level") return logging.level;
      if (key == "file") return std::string(logging.file ? "true" : "false");
      if (key == "file_path") return logging.file_path.string();
    }
  }

  return std::unexpected(makeError(ErrorCode::kNotFound,
                                   "Unknown config key: " + path[0] +
                                       (path.size() > 1 ? "." + path[1] : "")));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 2) {
    const auto& section = path[0];
    const auto& key = path[1];
    const auto full_key = section + "." + key;

    auto assignCount = [&](size_t& target) -> Result<void> {
      auto parsed = parseCount(value, full_key);
      if (!parsed) return std::unexpected(parsed.error());
      target = *parsed;
      return {};
    };

    if (section == "mask") {
      if (key == "visible_start") return assignCount(mask.visible_start);
      if (key == "visible_end") return assignCount(mask.visible_end);
      if (key == "mask_char") { mask.mask_char = value; return {}; }
      if (key == "sensitivity") { mask.sensitivity = value; return {}; }
    } else if (section == "digest") {
      if (key == "algorithm") { digest.algorithm = value; return {}; }
      if (key == "encoding") { digest.encoding = value; return {}; }
    } else if (section == "random") {
      if (key == "length") return assignCount(random.length);
      if (key == "charset") { random.charset = value; return {}; }
      if (key == "salt_length") return assignCount(random.salt_length);
    } else if (section == "logging") {
      if (key == "level") { logging.level = value; return {}; }
      if (key == "file") {
        auto parsed = parseBool(value, full_key);
        if (!parsed) return std::unexpected(parsed.error());
        logging.file = *parsed;
        return {};
      }
      if (key == "file_path") { logging.file_path = value; return {}; }
    }
  }

  return std::unexpected(makeError(ErrorCode::kNotFound,
                                   "Unknown config key: " + path[0] +
                                       (path.size() > 1 ? "." + path[1] : "")));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace ironclad::config
