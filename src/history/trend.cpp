#include "catalyst/history/trend.h"

#include <algorithm>
#include <iterator>
#include <set>

namespace catalyst::history {

TrendSummary compare_with_history(const domain::AnalysisReport& report,
                                  const HistoryRecord& previous) {
  std::set<std::string> before;
  for (const auto& summary : previous.detections) {
    before.insert(summary.rule_id);
  }
  std::set<std::string> now;
  for (const auto& detection : report.detections) {
    now.insert(detection.rule_id);
  }

  TrendSummary trend;
  trend.previous_timestamp = previous.timestamp;
  trend.previous_score = previous.health_score;
  trend.current_score = report.health_score;
  trend.score_delta = report.health_score - previous.health_score;
  std::set_difference(before.begin(), before.end(), now.begin(), now.end(),
                      std::back_inserter(trend.resolved_rule_ids));
  std::set_difference(now.begin(), now.end(), before.begin(), before.end(),
                      std::back_inserter(trend.new_rule_ids));
  return trend;
}

}  // namespace catalyst::history
