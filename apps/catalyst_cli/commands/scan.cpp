#include "scan.h"

#include "catalyst/domain/project_snapshot.h"
#include "catalyst/scanning/scan_error.h"
#include "catalyst/scanning/structure_scanner.h"

#include "exit_codes.h"
#include "shared/arg_parser.h"
#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ScanCliConfig {
  std::size_t workers{1};
  std::optional<std::size_t> timeout_ms;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_scan(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<catalyst::apps::Option<ScanCliConfig>> options = {
      {"--workers", true, "Concurrent subtree walkers (default 1)",
       [](ScanCliConfig& c, const std::string& v) {
         return catalyst::apps::parse_count("--workers", v, c.workers);
       }},
      {"--timeout-ms", true, "Abort the scan after this many milliseconds",
       [](ScanCliConfig& c, const std::string& v) {
         std::size_t ms = 0;
         if (!catalyst::apps::parse_count("--timeout-ms", v, ms)) {
           return false;
         }
         c.timeout_ms = ms;
         return true;
       }},
  };
  auto parsed = catalyst::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return kExitUsage;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: catalyst_cli scan <root> [--workers N] [--timeout-ms N]\n";
    return kExitUsage;
  }

  catalyst::scanning::ScanOptions scan_options;
  scan_options.max_workers = parsed.config.workers;
  if (parsed.config.timeout_ms.has_value()) {
    scan_options.deadline = std::chrono::steady_clock::now() +
                            std::chrono::milliseconds(parsed.config.timeout_ms.value());
  }

  const auto result = catalyst::scanning::scan(parsed.positionals.front(), scan_options);
  if (!result.has_value()) {
    const auto& error = result.error();
    std::cerr << "Error: scan failed (" << catalyst::scanning::to_string(error.kind)
              << "): " << error.message << ": " << error.path << "\n";
    return kExitError;
  }

  for (const auto& skipped : result.value().skipped_entries()) {
    std::cerr << "Warning: skipped " << skipped.path << ": " << skipped.reason << "\n";
  }
  std::cout << catalyst::domain::snapshot_to_json(result.value()).dump(2) << "\n";
  return kExitOk;
}
