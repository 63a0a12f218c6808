#pragma once

#include "catalyst/domain/analysis_report.h"
#include "catalyst/history/trend.h"
#include "catalyst/rules/rule_loader.h"

#include <optional>
#include <string>
#include <vector>

enum class OutputFormat {
  kText,
  kJson,
  kQuiet,
};

// Accepts "text", "json" or "quiet".
std::optional<OutputFormat> parse_output_format(const std::string& value);

void print_rule_warnings(const std::vector<catalyst::rules::LoadWarning>& warnings);

// Writes the report to stdout and maps the score to an exit code: kExitBelowThreshold when
// health_score < fail_below, otherwise kExitOk.
int emit_report(const catalyst::domain::AnalysisReport& report, OutputFormat format,
                int fail_below, const std::optional<catalyst::history::TrendSummary>& trend);
