#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "ironclad/common.hpp"
#include "ironclad/core/mask_config.hpp"
#include "ironclad/core/redactor.hpp"

namespace ironclad::core {

/**
 * @brief Build a MaskConfig from {visibleStart?, visibleEnd?, sensitivity?, maskChar?}
 *
 * Malformed fields fall back to their defaults (with a warning in the log)
 * instead of failing; an unknown sensitivity name silently means medium.
 *
 * @param options Rule options object; any other JSON type yields the defaults
 * @param base Defaults for fields the object does not set
 */
MaskConfig maskConfigFromJson(const nlohmann::ordered_json& options,
                              const MaskConfig& base = {});

/**
 * @brief Parse a JSON rule mapping, keeping the key order of the document
 * @param json_text e.g. {"\\d{4}-\\d{4}": {"visibleStart": 4}, "[a-z]+@[a-z.]+": {}}
 * @return Rule set, or kParseError for invalid JSON / non-object top level
 */
Result<RedactionRuleSet> parseRules(std::string_view json_text, const MaskConfig& base = {});

Result<RedactionRuleSet> parseRulesJson(const nlohmann::ordered_json& rules,
                                        const MaskConfig& base = {});

// Read and parse a JSON rules file
Result<RedactionRuleSet> loadRulesFile(const std::filesystem::path& path,
                                       const MaskConfig& base = {});

// Rule set -> JSON mapping (generators other than a literal are written as "*")
nlohmann::ordered_json rulesToJson(const RedactionRuleSet& rules);

// Mask a loosely typed value: strings are masked, anything else yields ""
std::string maskJsonValue(const nlohmann::json& value, const MaskConfig& config = {});

}  // namespace ironclad::core
