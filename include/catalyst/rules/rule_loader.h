#pragma once

#include "catalyst/core/result.h"
#include "catalyst/rules/rule.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace catalyst::rules {

// One rejected rule entry. index is the entry's position in the source "rules" array.
struct LoadWarning {
  std::size_t index{0};
  std::optional<std::string> rule_id;  // absent when the entry had no usable id
  std::string message;
};

struct RuleLoadResult {
  std::string version;
  std::vector<Rule> rules;  // declaration order, duplicates removed
  std::vector<LoadWarning> warnings;
};

// load_rules parses a JSON rule document of the form {"version": "...", "rules": [...]}.
//
// Per-entry problems never fail the load: the entry is dropped and one LoadWarning is
// recorded. The first occurrence of an id wins; later duplicates become warnings.
// An error is returned only when the document itself is unusable (not JSON, not an
// object, or no "rules" array).
[[nodiscard]] core::Result<RuleLoadResult, std::string> load_rules(std::string_view source);
[[nodiscard]] core::Result<RuleLoadResult, std::string> load_rules_json(const nlohmann::json& doc);

// Reads the file at path and forwards to load_rules.
[[nodiscard]] core::Result<RuleLoadResult, std::string> load_rules_file(const std::string& path);

// The built-in rule set shipped with the tool (mirrors assets/detection-rules.json).
[[nodiscard]] std::string_view default_rule_source();

// Renders a warning as a single diagnostic line: "rules[3] (missing-x): message".
[[nodiscard]] std::string describe_warning(const LoadWarning& warning);

}  // namespace catalyst::rules
