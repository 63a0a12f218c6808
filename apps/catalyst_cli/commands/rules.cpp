#include "rules.h"

#include "catalyst/app/app_service.h"
#include "catalyst/domain/classification.h"
#include "catalyst/rules/predicate.h"

#include <nlohmann/json.hpp>

#include "exit_codes.h"
#include "report_output.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RulesCliConfig {
  std::optional<std::string> rules_path;  // NOLINT(readability-identifier-naming)
  bool strict_rules{false};               // NOLINT(readability-identifier-naming)
};

nlohmann::json rule_to_summary_json(const catalyst::rules::Rule& rule) {
  nlohmann::json j;
  j["id"] = rule.id;
  j["kind"] = catalyst::domain::to_string(rule.kind);
  j["targets"] = rule.targets;
  j["confidence"] = catalyst::domain::to_string(rule.confidence);
  j["severity"] = catalyst::domain::to_string(rule.severity);
  j["category"] = catalyst::domain::to_string(rule.category);
  j["title"] = rule.title;
  if (rule.applies_when.has_value()) {
    j["applies_when"] = catalyst::rules::predicate_to_json(rule.applies_when.value());
  }
  if (rule.recommendation.has_value()) {
    j["template"] = rule.recommendation->template_id;
  }
  return j;
}

}  // namespace

int cmd_rules(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<catalyst::apps::Option<RulesCliConfig>> options = {
      {"--rules", true, "Rule file (JSON); the built-in rule set is used when omitted",
       [](RulesCliConfig& c, const std::string& v) {
         c.rules_path = v;
         return true;
       }},
      {"--strict-rules", false, "Exit with status 1 when any rule definition is rejected",
       [](RulesCliConfig& c, const std::string&) {
         c.strict_rules = true;
         return true;
       }},
  };
  auto parsed = catalyst::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return kExitUsage;
  }
  const bool validate = parsed.positionals.size() == 1 && parsed.positionals[0] == "validate";
  const bool list = parsed.positionals.size() == 1 && parsed.positionals[0] == "list";
  if (!validate && !list) {
    std::cerr << "Usage: catalyst_cli rules validate|list [--rules <file>] [--strict-rules]\n";
    return kExitUsage;
  }

  const auto loaded = catalyst::app::load_rule_set(parsed.config.rules_path);
  if (!loaded.has_value()) {
    std::cerr << "Error: " << loaded.error() << "\n";
    return kExitError;
  }
  const auto& rule_set = loaded.value();
  print_rule_warnings(rule_set.warnings);

  if (list) {
    nlohmann::json out;
    out["version"] = rule_set.version;
    out["rules"] = nlohmann::json::array();
    for (const auto& rule : rule_set.rules) {
      out["rules"].push_back(rule_to_summary_json(rule));
    }
    std::cout << out.dump(2) << "\n";
  } else {
    std::cout << "Rule set " << (parsed.config.rules_path.value_or("(built-in)")) << ": version "
              << rule_set.version << ", " << rule_set.rules.size() << " rule(s) accepted, "
              << rule_set.warnings.size() << " rejected\n";
  }

  if (parsed.config.strict_rules && !rule_set.warnings.empty()) {
    return kExitError;
  }
  return kExitOk;
}
