#include "analyze.h"

#include "catalyst/app/app_service.h"
#include "catalyst/core/clock.h"
#include "catalyst/core/id_generator.h"
#include "catalyst/core/services.h"

#include "analyze_logic.h"
#include "backends.h"
#include "exit_codes.h"
#include "shared/arg_parser.h"
#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

struct AnalyzeCliConfig {
  std::optional<std::string> rules_path;  // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kText};
  std::size_t workers{1};
  std::optional<std::size_t> timeout_ms;  // NOLINT(readability-identifier-naming)
  int fail_below{30};                     // NOLINT(readability-identifier-naming)
  BackendFlags backends;
  std::optional<std::string> session_id;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> project_id;  // NOLINT(readability-identifier-naming)
  bool strict_rules{false};               // NOLINT(readability-identifier-naming)
  bool show_audit{false};                 // NOLINT(readability-identifier-naming)
};

std::vector<catalyst::apps::Option<AnalyzeCliConfig>> analyze_options() {
  return {
      {"--rules", true, "Rule file (JSON); the built-in rule set is used when omitted",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.rules_path = v;
         return true;
       }},
      {"--format", true, "Output format (text|json|quiet)",
       [](AnalyzeCliConfig& c, const std::string& v) {
         const auto format = parse_output_format(v);
         if (!format.has_value()) {
           std::cerr << "Invalid --format: " << v << " (valid: text, json, quiet)\n";
           return false;
         }
         c.format = format.value();
         return true;
       }},
      {"--workers", true, "Worker threads for scanning and evaluation (default 1)",
       [](AnalyzeCliConfig& c, const std::string& v) {
         return catalyst::apps::parse_count("--workers", v, c.workers);
       }},
      {"--timeout-ms", true, "Abort the scan after this many milliseconds",
       [](AnalyzeCliConfig& c, const std::string& v) {
         std::size_t ms = 0;
         if (!catalyst::apps::parse_count("--timeout-ms", v, ms)) {
           return false;
         }
         c.timeout_ms = ms;
         return true;
       }},
      {"--fail-below", true, "Exit with status 3 when the health score is below N (default 30)",
       [](AnalyzeCliConfig& c, const std::string& v) {
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
      {"--history-db", true, "SQLite file for history and audit records",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.backends.history_db = v;
         return true;
       }},
      {"--redis", true, "Redis URI for history (e.g. tcp://127.0.0.1:6379)",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.backends.redis_uri = v;
         return true;
       }},
      {"--session-id", true, "Session scope for history records",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.session_id = v;
         return true;
       }},
      {"--project-id", true, "History key (defaults to the project directory name)",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.project_id = v;
         return true;
       }},
      {"--strict-rules", false, "Fail when any rule definition is rejected",
       [](AnalyzeCliConfig& c, const std::string&) {
         c.strict_rules = true;
         return true;
       }},
      {"--audit", false, "Print the audit trail to stderr after the report",
       [](AnalyzeCliConfig& c, const std::string&) {
         c.show_audit = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_analyze(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = analyze_options();
  auto parsed = catalyst::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return kExitUsage;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: catalyst_cli analyze <root> [options]\n";
    catalyst::apps::print_options(std::cerr, options);
    return kExitUsage;
  }
  const AnalyzeCliConfig& config = parsed.config;

  if (config.backends.history_db.has_value() && config.backends.redis_uri.has_value()) {
    std::cerr << "Error: --history-db and --redis are mutually exclusive\n";
    return kExitUsage;
  }
  const bool history_enabled =
      config.backends.history_db.has_value() || config.backends.redis_uri.has_value();
  if (history_enabled && !config.session_id.has_value()) {
    std::cerr << "Error: --session-id <id> is required when history is enabled\n";
    return kExitUsage;
  }

  auto backends = open_backends(config.backends);
  if (!backends.has_value()) {
    return kExitError;
  }

  std::optional<catalyst::history::HistoryBinding> history;
  if (backends->history_sink) {
    auto bound =
        catalyst::app::bind_history_session(*backends->history_sink, config.session_id.value());
    if (!bound.has_value()) {
      std::cerr << "Error: invalid --session-id: " << bound.error().message << "\n";
      return kExitUsage;
    }
    history = std::move(bound.value());
  }

  catalyst::app::AnalysisRequest request;
  request.root = parsed.positionals.front();
  request.rules_path = config.rules_path;
  request.strict_rules = config.strict_rules;
  request.scan_options.max_workers = config.workers;
  request.evaluation.workers = config.workers;
  if (config.timeout_ms.has_value()) {
    request.scan_options.deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config.timeout_ms.value());
  }
  request.project_identifier = config.project_id;

  AnalyzeOutputOptions output;
  output.format = config.format;
  output.fail_below = config.fail_below;
  output.show_audit = config.show_audit;

  catalyst::core::SystemIdGenerator id_gen;
  catalyst::core::SystemClock clock;
  catalyst::core::Services services{*backends->audit_log, std::move(history)};

  return execute_analyze(request, output, services, id_gen, clock);
}
