#include "ironclad/core/redactor.hpp"

#include <algorithm>

#include <re2/re2.h>
#include <spdlog/spdlog.h>

#include "ironclad/core/masker.hpp"
#include "ironclad/util/filesystem.hpp"

namespace ironclad::core {

namespace {

bool isContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

RedactionRuleSet::RedactionRuleSet(std::initializer_list<RedactionRule> rules) {
  for (const auto& rule : rules) {
    add(rule.pattern, rule.config);
  }
}

void RedactionRuleSet::add(std::string pattern, MaskConfig config) {
  auto it = std::find_if(rules_.begin(), rules_.end(),
                         [&](const RedactionRule& rule) { return rule.pattern == pattern; });
  if (it != rules_.end()) {
    it->config = std::move(config);
    return;
  }
  rules_.push_back(RedactionRule{std::move(pattern), std::move(config)});
}

const RedactionRule* RedactionRuleSet::find(std::string_view pattern) const {
  auto it = std::find_if(rules_.begin(), rules_.end(),
                         [&](const RedactionRule& rule) { return rule.pattern == pattern; });
  return it == rules_.end() ? nullptr : &*it;
}

size_t RedactionResult::totalMatches() const {
  size_t total = 0;
  for (const auto& outcome : outcomes) {
    total += outcome.matches;
  }
  return total;
}

size_t RedactionResult::failedRules() const {
  return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                           [](const RuleOutcome& o) { return !o.succeeded(); }));
}

Redactor::Redactor(RedactionRuleSet rules) : rules_(std::move(rules)) {}

Result<RuleApplication> Redactor::applyRule(std::string_view text, const RedactionRule& rule) {
  RE2::Options options;
  options.set_log_errors(false);
  RE2 regex(re2::StringPiece(rule.pattern.data(), rule.pattern.size()), options);
  if (!regex.ok()) {
    return std::unexpected(makeError(ErrorCode::kRegexError,
                                     "Invalid pattern '" + rule.pattern + "': " + regex.error()));
  }

  RuleApplication application;
  application.text.reserve(text.size());

  const re2::StringPiece input(text.data(), text.size());
  re2::StringPiece match;
  size_t position = 0;
  size_t last = 0;

  try {
    while (position <= text.size() &&
           regex.Match(input, position, text.size(), RE2::UNANCHORED, &match, 1)) {
      const size_t start = static_cast<size_t>(match.data() - text.data());
      const size_t end = start + match.size();

      application.text.append(text.substr(last, start - last));
      application.text.append(mask(text.substr(start, match.size()), rule.config));
      last = end;
      ++application.matches;

      if (end > start) {
        position = end;
      } else if (end < text.size()) {
        // Empty match: step over one whole UTF-8 character
        position = end + 1;
        while (position < text.size() && isContinuationByte(text[position])) {
          ++position;
        }
      } else {
        break;
      }
    }
    application.text.append(text.substr(last));
  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kMaskingError,
                                     "Masking failed for '" + rule.pattern + "': " + e.what()));
  }

  return application;
}

RedactionResult Redactor::redact(std::string_view text) const {
  RedactionResult result;
  result.text = std::string(text);
  result.outcomes.reserve(rules_.size());

  for (const auto& rule : rules_) {
    RuleOutcome outcome;
    outcome.pattern = rule.pattern;

    auto applied = applyRule(result.text, rule);
    if (applied.has_value()) {
      outcome.matches = applied->matches;
      result.text = std::move(applied->text);
      const auto& generator = rule.config.mask ? rule.config.mask : MaskConfig::defaultGenerator();
      spdlog::debug("Rule '{}' masked {} match(es) with {}", rule.pattern, outcome.matches,
                    generator->describe());
    } else {
      spdlog::warn("Error applying rule '{}': {}", rule.pattern, applied.error().message());
      outcome.error = applied.error();
    }

    result.outcomes.push_back(std::move(outcome));
  }

  return result;
}

Result<RedactionResult> Redactor::redactFile(
    const std::filesystem::path& source,
    const std::optional<std::filesystem::path>& destination) const {
  auto content = util::FileSystem::readFile(source);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  auto result = redact(*content);

  const auto& target = destination.value_or(source);
  auto write_result = util::FileSystem::writeFileAtomic(target, result.text);
  if (!write_result.has_value()) {
    return std::unexpected(write_result.error());
  }

  spdlog::info("Redacted {} -> {} ({} match(es), {} failed rule(s))", source.string(),
               target.string(), result.totalMatches(), result.failedRules());
  return result;
}

}  // namespace ironclad::core
