#define CATALYST_BACKEND_BOUNDARY_GUARD
#include "analyze_logic.h"

#include "catalyst/scanning/scan_error.h"

#include "exit_codes.h"
#include <iostream>
#include <string>

namespace {

void print_audit_trail(const std::string& trace_id, catalyst::core::Services& services) {
  std::cerr << "--- Audit Trail (trace_id=" << trace_id << ") ---\n";
  for (const auto& event : catalyst::app::fetch_audit_trace(trace_id, services)) {
    std::cerr << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
  }
}

}  // namespace

int execute_analyze(const catalyst::app::AnalysisRequest& request,
                    const AnalyzeOutputOptions& output, catalyst::core::Services& services,
                    catalyst::core::IIdGenerator& id_gen, catalyst::core::IClock& clock) {
  const auto result = catalyst::app::run_analysis_pipeline(request, services, id_gen, clock);

  if (!result.has_value()) {
    const auto& error = result.error();
    print_rule_warnings(error.rule_warnings);
    if (error.scan_error.has_value()) {
      std::cerr << "Error: scan failed ("
                << catalyst::scanning::to_string(error.scan_error->kind)
                << "): " << error.message << "\n";
    } else {
      std::cerr << "Error: " << error.message << "\n";
    }
    if (output.show_audit) {
      print_audit_trail(error.trace_id, services);
    }
    return kExitError;
  }

  const auto& response = result.value();
  print_rule_warnings(response.rule_warnings);
  for (const auto& skipped : response.skipped_entries) {
    std::cerr << "Warning: skipped " << skipped.path << ": " << skipped.reason << "\n";
  }
  if (response.history_error.has_value()) {
    std::cerr << "Warning: history not recorded: " << response.history_error.value() << "\n";
  }

  const int exit_code =
      emit_report(response.report, output.format, output.fail_below, response.trend);
  if (output.show_audit) {
    print_audit_trail(response.trace_id, services);
  }
  return exit_code;
}
