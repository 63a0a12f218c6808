#pragma once

#include "catalyst/domain/classification.h"
#include "catalyst/rules/predicate.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace catalyst::rules {

// Only meaningful for RuleKind::kFileQuality. At least one criterion is present.
struct QualityCriteria {
  std::optional<std::size_t> min_lines;        // NOLINT(readability-identifier-naming)
  std::vector<std::string> required_sections;  // NOLINT(readability-identifier-naming)
};

struct RecommendationVariant {
  Predicate when;
  std::string template_id;  // NOLINT(readability-identifier-naming)
};

// Variants are checked in declaration order; the first whose predicate holds replaces
// the default template.
struct Recommendation {
  std::string template_id;  // NOLINT(readability-identifier-naming)
  std::string reason;
  std::vector<RecommendationVariant> variants;
};

// Rule is one validated declarative check. Instances come from the loader; a Rule that
// exists has already passed validation.
struct Rule {
  std::string id;
  domain::RuleKind kind{domain::RuleKind::kFileAbsence};
  std::vector<std::string> targets;  // candidates, any one satisfies the check
  domain::Confidence confidence{domain::Confidence::kMedium};
  domain::Severity severity{domain::Severity::kMedium};
  domain::Category category{domain::Category::kOther};
  std::string title;
  std::optional<QualityCriteria> quality_criteria;  // NOLINT(readability-identifier-naming)
  std::optional<Predicate> applies_when;            // NOLINT(readability-identifier-naming)
  std::optional<Recommendation> recommendation;
};

}  // namespace catalyst::rules
