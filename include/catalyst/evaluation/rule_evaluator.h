#pragma once

#include "catalyst/domain/analysis_report.h"
#include "catalyst/domain/detection.h"
#include "catalyst/domain/project_snapshot.h"
#include "catalyst/evaluation/content_source.h"
#include "catalyst/rules/rule.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace catalyst::evaluation {

struct EvaluationOptions {
  // Rules evaluated concurrently. 0 and 1 both mean sequential evaluation.
  std::size_t workers{1};
};

// RuleEvaluator turns a snapshot and a rule list into an AnalysisReport.
//
// Each rule reads only the immutable snapshot, its own Rule value and (for FileQuality)
// the content source, and writes only its own Detection. The final report order comes
// from the sort alone, so the output is identical for every worker count.
class RuleEvaluator {
 public:
  explicit RuleEvaluator(EvaluationOptions options = {});

  [[nodiscard]] domain::AnalysisReport evaluate(const domain::ProjectSnapshot& snapshot,
                                                const std::vector<rules::Rule>& rules,
                                                const IFileContentSource& content,
                                                const std::string& rule_set_version = "") const;

  // Evaluates one rule. Returns nullopt when applies_when excludes it.
  [[nodiscard]] std::optional<domain::Detection> evaluate_rule(
      const domain::ProjectSnapshot& snapshot, const rules::Rule& rule,
      const IFileContentSource& content) const;

 private:
  EvaluationOptions options_;
};

// Detection order used in reports: priority score descending, rule_id ascending.
[[nodiscard]] bool detection_order(const domain::Detection& a, const domain::Detection& b);

// resolve_recommendation picks the first variant whose condition holds, falling back to
// the rule's default template.
[[nodiscard]] std::optional<domain::ResolvedRecommendation> resolve_recommendation(
    const rules::Rule& rule, const domain::ProjectSnapshot& snapshot);

}  // namespace catalyst::evaluation
