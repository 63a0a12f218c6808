#pragma once

#include <cstddef>
#include <string>

namespace catalyst::evaluation {

// compute_health_score implements
//
//   issues_penalty = issues / total * 100   (0 when total == 0)
//   score          = clamp(100 - issues_penalty - 20 * high - 10 * medium, 0, 100)
//
// The fraction is floored. The computation is done exactly in integer arithmetic as
// floor((100*T - 100*I - (20*H + 10*M)*T) / T), so 13/4/1/2 yields 29 on every platform.
[[nodiscard]] int compute_health_score(std::size_t total_patterns, std::size_t issues_found,
                                       std::size_t high_severity, std::size_t medium_severity);

enum class HealthTier {
  kExcellent,         // >= 90
  kGood,              // >= 70
  kNeedsImprovement,  // >= 50
  kPoor,              // >= 30
  kCritical,          // < 30
};

[[nodiscard]] HealthTier classify_health(int score);
[[nodiscard]] std::string tier_label(HealthTier tier);

}  // namespace catalyst::evaluation
