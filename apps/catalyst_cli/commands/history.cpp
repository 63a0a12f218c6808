#include "history.h"

#include "backends.h"
#include "exit_codes.h"
#include "history_logic.h"
#include "shared/arg_parser.h"
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct HistoryCliConfig {
  BackendFlags backends;
  std::optional<std::string> session_id;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> project_id;  // NOLINT(readability-identifier-naming)
  std::size_t limit{20};
};

}  // namespace

int cmd_history(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<catalyst::apps::Option<HistoryCliConfig>> options = {
      {"--history-db", true, "SQLite file holding history records",
       [](HistoryCliConfig& c, const std::string& v) {
         c.backends.history_db = v;
         return true;
       }},
      {"--redis", true, "Redis URI holding history records",
       [](HistoryCliConfig& c, const std::string& v) {
         c.backends.redis_uri = v;
         return true;
       }},
      {"--session-id", true, "Session scope to read from (required)",
       [](HistoryCliConfig& c, const std::string& v) {
         c.session_id = v;
         return true;
       }},
      {"--project-id", true, "Project identifier to read (required)",
       [](HistoryCliConfig& c, const std::string& v) {
         c.project_id = v;
         return true;
       }},
      {"--limit", true, "Maximum number of records (default 20)",
       [](HistoryCliConfig& c, const std::string& v) {
         return catalyst::apps::parse_count("--limit", v, c.limit);
       }},
  };
  auto parsed = catalyst::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return kExitUsage;
  }
  const HistoryCliConfig& config = parsed.config;

  if (!parsed.positionals.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    return kExitUsage;
  }
  if (!config.session_id.has_value()) {
    std::cerr << "Error: --session-id <id> is required\n";
    return kExitUsage;
  }
  if (!config.project_id.has_value()) {
    std::cerr << "Error: --project-id <id> is required\n";
    return kExitUsage;
  }
  if (config.backends.history_db.has_value() == config.backends.redis_uri.has_value()) {
    std::cerr << "Error: exactly one of --history-db or --redis is required\n";
    return kExitUsage;
  }

  auto backends = open_backends(config.backends);
  if (!backends.has_value()) {
    return kExitError;
  }
  return execute_history(config.project_id.value(), config.session_id.value(), config.limit,
                         *backends->history_sink);
}
