#include "evaluate.h"

#include "catalyst/app/app_service.h"
#include "catalyst/core/file_io.h"
#include "catalyst/domain/project_snapshot.h"

#include <nlohmann/json.hpp>

#include "exit_codes.h"
#include "report_output.h"
#include "shared/arg_parser.h"
#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct EvaluateCliConfig {
  std::optional<std::string> snapshot_path;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> rules_path;     // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kText};
  std::size_t workers{1};
  int fail_below{30};        // NOLINT(readability-identifier-naming)
  bool strict_rules{false};  // NOLINT(readability-identifier-naming)
};

std::optional<catalyst::domain::ProjectSnapshot> read_snapshot(const std::string& path) {
  const auto text = catalyst::core::read_text_file(path);
  if (!text.has_value()) {
    std::cerr << "Error: " << text.error() << "\n";
    return std::nullopt;
  }
  try {
    return catalyst::domain::snapshot_from_json(nlohmann::json::parse(text.value()));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Error: malformed snapshot " << path << ": " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: malformed snapshot " << path << ": " << e.what() << "\n";
  }
  return std::nullopt;
}

}  // namespace

int cmd_evaluate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<catalyst::apps::Option<EvaluateCliConfig>> options = {
      {"--snapshot", true, "Snapshot file produced by `catalyst_cli scan`",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.snapshot_path = v;
         return true;
       }},
      {"--rules", true, "Rule file (JSON); the built-in rule set is used when omitted",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.rules_path = v;
         return true;
       }},
      {"--format", true, "Output format (text|json|quiet)",
       [](EvaluateCliConfig& c, const std::string& v) {
         const auto format = parse_output_format(v);
         if (!format.has_value()) {
           std::cerr << "Invalid --format: " << v << " (valid: text, json, quiet)\n";
           return false;
         }
         c.format = format.value();
         return true;
       }},
      {"--workers", true, "Rule evaluation workers (default 1)",
       [](EvaluateCliConfig& c, const std::string& v) {
         return catalyst::apps::parse_count("--workers", v, c.workers);
       }},
      {"--fail-below", true, "Exit with status 3 when the health score is below N (default 30)",
       [](EvaluateCliConfig& c, const std::string& v) {
         std::size_t threshold = 0;
         if (!catalyst::apps::parse_count("--fail-below", v, threshold)) {
           return false;
         }
         if (threshold > 100) {
           std::cerr << "Invalid --fail-below: " << v << " (expected 0-100)\n";
           return false;
         }
         c.fail_below = static_cast<int>(threshold);
         return true;
       }},
      {"--strict-rules", false, "Fail when any rule definition is rejected",
       [](EvaluateCliConfig& c, const std::string&) {
         c.strict_rules = true;
         return true;
       }},
  };
  auto parsed = catalyst::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return kExitUsage;
  }
  const EvaluateCliConfig& config = parsed.config;
  if (!config.snapshot_path.has_value() || !parsed.positionals.empty()) {
    std::cerr << "Usage: catalyst_cli evaluate --snapshot <file> [options]\n";
    return kExitUsage;
  }

  const auto snapshot = read_snapshot(config.snapshot_path.value());
  if (!snapshot.has_value()) {
    return kExitError;
  }

  const auto rule_set = catalyst::app::load_rule_set(config.rules_path);
  if (!rule_set.has_value()) {
    std::cerr << "Error: " << rule_set.error() << "\n";
    return kExitError;
  }
  print_rule_warnings(rule_set.value().warnings);
  if (config.strict_rules && !rule_set.value().warnings.empty()) {
    std::cerr << "Error: " << rule_set.value().warnings.size()
              << " rule definition(s) rejected in strict mode\n";
    return kExitError;
  }

  catalyst::evaluation::EvaluationOptions evaluation;
  evaluation.workers = config.workers;
  const auto report =
      catalyst::app::evaluate_snapshot(snapshot.value(), rule_set.value(), evaluation);
  return emit_report(report, config.format, config.fail_below, std::nullopt);
}
