#pragma once

#include "catalyst/domain/classification.h"
#include "catalyst/domain/detection.h"
#include "catalyst/domain/project_snapshot.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace catalyst::domain {

// One line per evaluated rule, positive or not. Drives the per-category status lines,
// which need to know about passing checks too.
struct CheckOutcome {
  std::string rule_id;  // NOLINT(readability-identifier-naming)
  Category category{Category::kOther};
  Severity severity{Severity::kMedium};
  bool issue_found{false};  // NOLINT(readability-identifier-naming)
};

struct AnalysisSummary {
  std::size_t total_patterns{0};   // rules evaluated after applies_when filtering
  std::size_t issues_found{0};     // NOLINT(readability-identifier-naming)
  std::size_t high_severity{0};    // NOLINT(readability-identifier-naming)
  std::size_t medium_severity{0};  // NOLINT(readability-identifier-naming)
  std::size_t low_severity{0};     // NOLINT(readability-identifier-naming)
};

// AnalysisReport aggregates all detections for one snapshot.
//
// Ordering contract: detections holds only positive detections, sorted by priority score
// descending with rule_id ascending as tie-break. checks is sorted by rule_id.
struct AnalysisReport {
  std::string project_name;               // NOLINT(readability-identifier-naming)
  std::set<ProjectType> project_types;    // NOLINT(readability-identifier-naming)
  std::set<std::string> frameworks;
  std::string rule_set_version;           // NOLINT(readability-identifier-naming)
  std::vector<Detection> detections;
  std::vector<CheckOutcome> checks;
  AnalysisSummary summary;
  int health_score{100};  // NOLINT(readability-identifier-naming)
};

// Exchange format. Keys are sorted alphabetically; array order is preserved, so a
// serialized report keeps its detection ordering.
[[nodiscard]] nlohmann::json detection_to_json(const Detection& detection);
[[nodiscard]] Detection detection_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json report_to_json(const AnalysisReport& report);

// Throws nlohmann::json::exception on missing fields or type mismatches and
// std::invalid_argument on unknown enum tags.
[[nodiscard]] AnalysisReport report_from_json(const nlohmann::json& j);

}  // namespace catalyst::domain
