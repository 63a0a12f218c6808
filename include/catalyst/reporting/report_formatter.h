#pragma once

#include "catalyst/domain/analysis_report.h"
#include "catalyst/history/trend.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace catalyst::reporting {

inline constexpr std::size_t kTopPriorityCount = 5;

struct FormatOptions {
  // Appended as a "Trend" section when present.
  std::optional<history::TrendSummary> trend;
  // Lists passing categories too, not only those with issues.
  bool show_passing{true};  // NOLINT(readability-identifier-naming)
};

// Human-readable report: title, project info, per-category status, top priority actions
// (taken from report.detections in order) and the health line.
[[nodiscard]] std::string format_text(const domain::AnalysisReport& report,
                                      const FormatOptions& options = {});

// Machine-readable report: the exchange document plus "health_tier" and, when present,
// "trend".
[[nodiscard]] nlohmann::json format_json(const domain::AnalysisReport& report,
                                         const FormatOptions& options = {});

// Score only, e.g. "72".
[[nodiscard]] std::string format_quiet(const domain::AnalysisReport& report);

[[nodiscard]] nlohmann::json trend_to_json(const history::TrendSummary& trend);

}  // namespace catalyst::reporting
