#pragma once

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ironclad/common.hpp"
#include "ironclad/core/mask_config.hpp"

namespace ironclad::core {

/**
 * @brief A regular expression paired with the mask applied to each match
 */
struct RedactionRule {
  std::string pattern;
  MaskConfig config;
};

/**
 * @brief Ordered pattern -> MaskConfig mapping with unique patterns
 *
 * Rules are applied in insertion order. Adding a pattern that is already
 * present replaces its config but keeps its position.
 */
class RedactionRuleSet {
public:
  using const_iterator = std::vector<RedactionRule>::const_iterator;

  RedactionRuleSet() = default;
  RedactionRuleSet(std::initializer_list<RedactionRule> rules);

  void add(std::string pattern, MaskConfig config);

  const RedactionRule* find(std::string_view pattern) const;

  size_t size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }

  const_iterator begin() const { return rules_.begin(); }
  const_iterator end() const { return rules_.end(); }

private:
  std::vector<RedactionRule> rules_;
};

// Per-rule result of a redaction pass
struct RuleOutcome {
  std::string pattern;
  size_t matches = 0;
  std::optional<Error> error;

  bool succeeded() const { return !error.has_value(); }
};

struct RedactionResult {
  std::string text;
  std::vector<RuleOutcome> outcomes;

  size_t totalMatches() const;
  size_t failedRules() const;
};

// Text produced by a single rule
struct RuleApplication {
  std::string text;
  size_t matches = 0;
};

/**
 * @brief Applies a rule set to text or files
 *
 * Rules are folded over the text one after another: each rule sees the output
 * of the previous one. A rule that fails to compile, or whose masking throws,
 * leaves the text as it was and is reported in its RuleOutcome; the remaining
 * rules still run.
 */
class Redactor {
public:
  explicit Redactor(RedactionRuleSet rules);

  const RedactionRuleSet& rules() const { return rules_; }

  /**
   * @brief Redact text with every rule, in order
   * @param text Input text (not modified)
   * @return Redacted text plus one outcome per rule
   */
  RedactionResult redact(std::string_view text) const;

  /**
   * @brief Read source, redact it in memory and write the result
   * @param source File to read
   * @param destination File to write; defaults to source (in-place)
   * @return Redaction result, or the I/O error that stopped the operation
   */
  Result<RedactionResult> redactFile(
      const std::filesystem::path& source,
      const std::optional<std::filesystem::path>& destination = std::nullopt) const;

  /**
   * @brief Replace every non-overlapping match of one rule in text
   * @return New text and match count; kRegexError or kMaskingError on failure
   */
  static Result<RuleApplication> applyRule(std::string_view text, const RedactionRule& rule);

private:
  RedactionRuleSet rules_;
};

}  // namespace ironclad::core
