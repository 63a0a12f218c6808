#include "catalyst/evaluation/scoring.h"

#include <algorithm>

namespace catalyst::evaluation {

int compute_health_score(const std::size_t total_patterns, const std::size_t issues_found,
                         const std::size_t high_severity, const std::size_t medium_severity) {
  const auto total = static_cast<long long>(total_patterns);
  const auto issues = static_cast<long long>(issues_found);
  const long long severity_penalty =
      20 * static_cast<long long>(high_severity) + 10 * static_cast<long long>(medium_severity);

  long long score = 0;
  if (total == 0) {
    score = 100 - severity_penalty;
  } else {
    const long long numerator = 100 * total - 100 * issues - severity_penalty * total;
    // Floor division; C++ integer division truncates toward zero.
    score = numerator >= 0 ? numerator / total : -((-numerator + total - 1) / total);
  }

  return static_cast<int>(std::clamp<long long>(score, 0, 100));
}

HealthTier classify_health(const int score) {
  if (score >= 90) {
    return HealthTier::kExcellent;
  }
  if (score >= 70) {
    return HealthTier::kGood;
  }
  if (score >= 50) {
    return HealthTier::kNeedsImprovement;
  }
  if (score >= 30) {
    return HealthTier::kPoor;
  }
  return HealthTier::kCritical;
}

std::string tier_label(const HealthTier tier) {
  switch (tier) {
    case HealthTier::kExcellent:
      return "Excellent";
    case HealthTier::kGood:
      return "Good";
    case HealthTier::kNeedsImprovement:
      return "Needs Improvement";
    case HealthTier::kPoor:
      return "Poor";
    case HealthTier::kCritical:
      return "Critical";
  }
  return "Critical";
}

}  // namespace catalyst::evaluation
