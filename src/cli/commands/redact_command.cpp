#include "ironclad/cli/commands/redact_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ironclad/core/rule_parser.hpp"

namespace ironclad::cli {

RedactCommand::RedactCommand(Application& app) : app_(app) {
}

void RedactCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("-f,--file", file_, "Path to the file to redact")->required();
  auto* rules = cmd->add_option(
      "-r,--rules", rules_json_,
      R"(Redaction rules as JSON, e.g. '{"\\d{4}": {"visibleStart": 1, "visibleEnd": 1}}')");
  auto* rules_file = cmd->add_option("--rules-file", rules_file_, "Path to a JSON rules file");
  rules->excludes(rules_file);
  cmd->add_option("-o,--output", output_,
                  "Path to save the redacted file (default: overwrite original)");
}

Result<core::RedactionRuleSet> RedactCommand::resolveRules() {
  const auto& config = app_.config();
  const auto base = config.maskDefaults();

  if (!rules_json_.empty()) {
    return core::parseRules(rules_json_, base);
  }
  if (!rules_file_.empty()) {
    return core::loadRulesFile(rules_file_, base);
  }

  auto rules = config.redactionRules();
  if (rules.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "No redaction rules: pass --rules, --rules-file or add "
                                     "[[redact.rules]] to the config"));
  }
  return rules;
}

Result<int> RedactCommand::execute(const GlobalOptions& options) {
  auto rules = resolveRules();
  if (!rules.has_value()) {
    return std::unexpected(rules.error());
  }

  core::Redactor redactor(std::move(*rules));

  std::optional<std::filesystem::path> destination;
  if (!output_.empty()) {
    destination = output_;
  }

  auto result = redactor.redactFile(file_, destination);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  outputResult(*result, output_.empty() ? file_ : output_, options);
  return 0;
}

void RedactCommand::outputResult(const core::RedactionResult& result, const std::string& target,
                                 const GlobalOptions& options) {
  if (options.json) {
    nlohmann::json output;
    output["file"] = file_;
    output["output"] = target;
    output["overwritten"] = target == file_;
    output["matches"] = result.totalMatches();

    auto rules = nlohmann::json::array();
    for (const auto& outcome : result.outcomes) {
      nlohmann::json rule;
      rule["pattern"] = outcome.pattern;
      rule["matches"] = outcome.matches;
      if (outcome.error) {
        rule["error"] = outcome.error->message();
        rule["code"] = std::string(errorCodeToString(outcome.error->code()));
      }
      rules.push_back(std::move(rule));
    }
    output["rules"] = std::move(rules);
    std::cout << output.dump(2) << std::endl;
    return;
  }

  // Failed rules were already reported by the redactor's warning log
  if (!options.quiet) {
    if (target == file_) {
      std::cout << "File redacted successfully. Original file overwritten." << std::endl;
    } else {
      std::cout << "File redacted successfully. Redacted content saved to: " << target
                << std::endl;
    }
  }
}

} // namespace ironclad::cli
