#pragma once

#include "catalyst/domain/classification.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace catalyst::domain {

// Evidence collected while evaluating one rule. Which fields are populated depends on
// the rule kind; absence checks only set matched_candidate.
struct Evidence {
  std::optional<std::string> matched_candidate;  // first present target, if any
  std::optional<std::size_t> line_count;         // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> min_lines;          // NOLINT(readability-identifier-naming)
  std::vector<std::string> matched_sections;     // NOLINT(readability-identifier-naming)
  std::vector<std::string> missing_sections;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> read_error;         // NOLINT(readability-identifier-naming)
  // All sections present but line count within 80% of the minimum. Informational only;
  // the detection's confidence stays as declared on the rule.
  bool marginal_quality{false};  // NOLINT(readability-identifier-naming)
  std::vector<std::string> notes;
};

// Recommendation after variant selection.
struct ResolvedRecommendation {
  std::string template_id;        // NOLINT(readability-identifier-naming)
  std::string reason;             // NOLINT(readability-identifier-naming)
  bool variant_applied{false};    // NOLINT(readability-identifier-naming)
};

// Detection is the output of evaluating one applicable rule against one snapshot.
struct Detection {
  std::string rule_id;  // NOLINT(readability-identifier-naming)
  RuleKind kind{RuleKind::kFileAbsence};
  bool issue_found{false};  // NOLINT(readability-identifier-naming)
  Confidence confidence{Confidence::kMedium};
  Severity severity{Severity::kMedium};
  Category category{Category::kOther};
  std::string title;
  Evidence evidence;
  std::optional<ResolvedRecommendation> recommendation;

  [[nodiscard]] double priority_score() const noexcept {
    return domain::priority_score(confidence, severity);
  }
};

}  // namespace catalyst::domain
