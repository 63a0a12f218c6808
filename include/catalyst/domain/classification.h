#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace catalyst::domain {

// Evidentiary strength of a check. Fixed per rule; never re-scored by evaluation.
enum class Confidence {
  kLow,
  kMedium,
  kHigh,
};

// Impact of a detected issue if it is left unaddressed.
enum class Severity {
  kLow,
  kMedium,
  kHigh,
};

enum class RuleKind {
  kFileAbsence,
  kDirectoryAbsence,
  kFileQuality,
};

// Fixed report taxonomy. kOther collects rules that match no known category.
enum class Category {
  kGit,
  kDocumentation,
  kCiCd,
  kCodeQuality,
  kSetup,
  kSecurity,
  kOther,
};

[[nodiscard]] std::string to_string(Confidence confidence);
[[nodiscard]] std::string to_string(Severity severity);
[[nodiscard]] std::string to_string(RuleKind kind);
[[nodiscard]] std::string to_string(Category category);

// Display label used by the text report ("CI/CD", "Code Quality", ...).
[[nodiscard]] std::string category_label(Category category);

// Parsers accept the lowercase wire spelling ("high", "file_absence", "ci_cd").
// Return nullopt for anything else.
[[nodiscard]] std::optional<Confidence> parse_confidence(std::string_view text);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);
[[nodiscard]] std::optional<RuleKind> parse_rule_kind(std::string_view text);
[[nodiscard]] std::optional<Category> parse_category(std::string_view text);

// infer_category maps a rule id onto the taxonomy by keyword, for rules that do not
// declare a category explicitly.
[[nodiscard]] Category infer_category(std::string_view rule_id);

// Priority weights.
//   confidence_weight:   High=1.0, Medium=0.7, Low=0.4
//   severity_multiplier: High=1.0, Medium=0.6, Low=0.3
//   base_priority:       High=10,  Medium=5,   Low=2
[[nodiscard]] constexpr double confidence_weight(const Confidence c) noexcept {
  switch (c) {
    case Confidence::kHigh:
      return 1.0;
    case Confidence::kMedium:
      return 0.7;
    case Confidence::kLow:
      return 0.4;
  }
  return 0.7;
}

[[nodiscard]] constexpr double severity_multiplier(const Severity s) noexcept {
  switch (s) {
    case Severity::kHigh:
      return 1.0;
    case Severity::kMedium:
      return 0.6;
    case Severity::kLow:
      return 0.3;
  }
  return 0.6;
}

[[nodiscard]] constexpr int base_priority(const Severity s) noexcept {
  switch (s) {
    case Severity::kHigh:
      return 10;
    case Severity::kMedium:
      return 5;
    case Severity::kLow:
      return 2;
  }
  return 5;
}

[[nodiscard]] constexpr double priority_score(const Confidence c, const Severity s) noexcept {
  return confidence_weight(c) * severity_multiplier(s) * static_cast<double>(base_priority(s));
}

}  // namespace catalyst::domain
