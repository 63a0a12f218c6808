#pragma once

#include "catalyst/domain/analysis_report.h"
#include "catalyst/history/history_record.h"

#include <string>
#include <vector>

namespace catalyst::history {

// TrendSummary compares a fresh report with the most recent stored run.
struct TrendSummary {
  std::string previous_timestamp;             // NOLINT(readability-identifier-naming)
  int previous_score{0};                      // NOLINT(readability-identifier-naming)
  int current_score{0};                       // NOLINT(readability-identifier-naming)
  int score_delta{0};                         // current - previous
  std::vector<std::string> resolved_rule_ids;  // flagged before, not now (sorted)
  std::vector<std::string> new_rule_ids;       // flagged now, not before (sorted)
};

[[nodiscard]] TrendSummary compare_with_history(const domain::AnalysisReport& report,
                                                const HistoryRecord& previous);

}  // namespace catalyst::history
