#include "report_output.h"

#include "catalyst/reporting/report_formatter.h"

#include "exit_codes.h"
#include <iostream>

std::optional<OutputFormat> parse_output_format(const std::string& value) {
  if (value == "text") {
    return OutputFormat::kText;
  }
  if (value == "json") {
    return OutputFormat::kJson;
  }
  if (value == "quiet") {
    return OutputFormat::kQuiet;
  }
  return std::nullopt;
}

void print_rule_warnings(const std::vector<catalyst::rules::LoadWarning>& warnings) {
  for (const auto& warning : warnings) {
    std::cerr << "Warning: " << catalyst::rules::describe_warning(warning) << "\n";
  }
}

int emit_report(const catalyst::domain::AnalysisReport& report, const OutputFormat format,
                const int fail_below,
                const std::optional<catalyst::history::TrendSummary>& trend) {
  catalyst::reporting::FormatOptions options;
  options.trend = trend;

  switch (format) {
    case OutputFormat::kText:
      std::cout << catalyst::reporting::format_text(report, options);
      break;
    case OutputFormat::kJson:
      std::cout << catalyst::reporting::format_json(report, options).dump(2) << "\n";
      break;
    case OutputFormat::kQuiet:
      std::cout << catalyst::reporting::format_quiet(report) << "\n";
      break;
  }

  return report.health_score < fail_below ? kExitBelowThreshold : kExitOk;
}
