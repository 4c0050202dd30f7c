#include "ironclad/core/rule_parser.hpp"

#include <spdlog/spdlog.h>

#include "ironclad/core/masker.hpp"
#include "ironclad/util/filesystem.hpp"

namespace ironclad::core {

namespace {

// Non-negative integer field, or fallback with a warning
size_t readVisibleCount(const nlohmann::ordered_json& options, const char* key, size_t fallback) {
  auto it = options.find(key);
  if (it == options.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_number_unsigned()) {
    return it->get<size_t>();
  }
  if (it->is_number_integer() && it->get<int64_t>() >= 0) {
    return static_cast<size_t>(it->get<int64_t>());
  }
  spdlog::warn("Ignoring invalid '{}' value {} (expected a non-negative integer)", key,
               it->dump());
  return fallback;
}

}  // namespace

MaskConfig maskConfigFromJson(const nlohmann::ordered_json& options, const MaskConfig& base) {
  MaskConfig config = base;
  if (!options.is_object()) {
    if (!options.is_null()) {
      spdlog::warn("Rule options must be an object, using defaults (got {})", options.type_name());
    }
    return config;
  }

  config.visible_start = readVisibleCount(options, "visibleStart", base.visible_start);
  config.visible_end = readVisibleCount(options, "visibleEnd", base.visible_end);

  if (auto it = options.find("sensitivity"); it != options.end()) {
    // Unknown names mean medium
    config.sensitivity = it->is_string() ? parseSensitivity(it->get<std::string>())
                                         : Sensitivity::kMedium;
  }

  if (auto it = options.find("maskChar"); it != options.end()) {
    if (it->is_string()) {
      config.withMaskChar(it->get<std::string>());
    } else {
      spdlog::warn("Ignoring non-string 'maskChar' value {}", it->dump());
    }
  }

  return config;
}

Result<RedactionRuleSet> parseRulesJson(const nlohmann::ordered_json& rules, const MaskConfig& base) {
  if (!rules.is_object()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Redaction rules must be a JSON object mapping patterns to options"));
  }

  RedactionRuleSet rule_set;
  for (const auto& [pattern, options] : rules.items()) {
    rule_set.add(pattern, maskConfigFromJson(options, base));
  }
  return rule_set;
}

Result<RedactionRuleSet> parseRules(std::string_view json_text, const MaskConfig& base) {
  nlohmann::ordered_json rules;
  try {
    rules = nlohmann::ordered_json::parse(json_text.begin(), json_text.end());
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid rules JSON: " + std::string(e.what())));
  }
  return parseRulesJson(rules, base);
}

Result<RedactionRuleSet> loadRulesFile(const std::filesystem::path& path, const MaskConfig& base) {
  auto content = util::FileSystem::readFile(path);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }
  return parseRules(*content, base);
}

nlohmann::ordered_json rulesToJson(const RedactionRuleSet& rules) {
  auto json = nlohmann::ordered_json::object();
  for (const auto& rule : rules) {
    nlohmann::ordered_json options;
    options["visibleStart"] = rule.config.visible_start;
    options["visibleEnd"] = rule.config.visible_end;
    options["sensitivity"] = sensitivityToString(rule.config.sensitivity);
    auto literal = std::dynamic_pointer_cast<const RepeatMaskGenerator>(rule.config.mask);
    options["maskChar"] = literal ? literal->literal() : std::string(kDefaultMaskChar);
    json[rule.pattern] = std::move(options);
  }
  return json;
}

std::string maskJsonValue(const nlohmann::json& value, const MaskConfig& config) {
  if (!value.is_string()) {
    return {};
  }
  return mask(value.get_ref<const std::string&>(), config);
}

}  // namespace ironclad::core
