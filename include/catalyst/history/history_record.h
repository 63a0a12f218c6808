#pragma once

#include "catalyst/domain/analysis_report.h"
#include "catalyst/domain/classification.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace catalyst::history {

struct DetectionSummary {
  std::string rule_id;  // NOLINT(readability-identifier-naming)
  domain::Severity severity{domain::Severity::kMedium};
  domain::Confidence confidence{domain::Confidence::kMedium};
  double priority_score{0.0};  // NOLINT(readability-identifier-naming)
};

// HistoryRecord is the persisted digest of one analysis run.
// session_id and domain are stamped by the sink from the request's isolation context,
// so a stored record always carries the isolation it was written under.
struct HistoryRecord {
  std::string timestamp;
  std::string project_identifier;  // NOLINT(readability-identifier-naming)
  int health_score{0};             // NOLINT(readability-identifier-naming)
  std::size_t total_patterns{0};   // NOLINT(readability-identifier-naming)
  std::size_t issues_found{0};     // NOLINT(readability-identifier-naming)
  std::vector<DetectionSummary> detections;
  std::string session_id;  // NOLINT(readability-identifier-naming)
  std::string domain;
};

// Builds a record from a finished report. Detection order follows the report.
[[nodiscard]] HistoryRecord make_history_record(const domain::AnalysisReport& report,
                                                const std::string& project_identifier,
                                                const std::string& timestamp);

[[nodiscard]] nlohmann::json record_to_json(const HistoryRecord& record);

// Throws nlohmann::json::exception on missing fields and std::invalid_argument on unknown
// severity or confidence tags.
[[nodiscard]] HistoryRecord record_from_json(const nlohmann::json& j);

}  // namespace catalyst::history
