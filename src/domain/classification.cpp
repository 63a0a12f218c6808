#include "catalyst/domain/classification.h"

#include "catalyst/core/normalization.h"

namespace catalyst::domain {

std::string to_string(const Confidence confidence) {
  switch (confidence) {
    case Confidence::kHigh:
      return "high";
    case Confidence::kMedium:
      return "medium";
    case Confidence::kLow:
      return "low";
  }
  return "medium";
}

std::string to_string(const Severity severity) {
  switch (severity) {
    case Severity::kHigh:
      return "high";
    case Severity::kMedium:
      return "medium";
    case Severity::kLow:
      return "low";
  }
  return "medium";
}

std::string to_string(const RuleKind kind) {
  switch (kind) {
    case RuleKind::kFileAbsence:
      return "file_absence";
    case RuleKind::kDirectoryAbsence:
      return "directory_absence";
    case RuleKind::kFileQuality:
      return "file_quality";
  }
  return "file_absence";
}

std::string to_string(const Category category) {
  switch (category) {
    case Category::kGit:
      return "git";
    case Category::kDocumentation:
      return "documentation";
    case Category::kCiCd:
      return "ci_cd";
    case Category::kCodeQuality:
      return "code_quality";
    case Category::kSetup:
      return "setup";
    case Category::kSecurity:
      return "security";
    case Category::kOther:
      return "other";
  }
  return "other";
}

std::string category_label(const Category category) {
  switch (category) {
    case Category::kGit:
      return "Git Configuration";
    case Category::kDocumentation:
      return "Documentation";
    case Category::kCiCd:
      return "CI/CD";
    case Category::kCodeQuality:
      return "Code Quality";
    case Category::kSetup:
      return "Setup";
    case Category::kSecurity:
      return "Security";
    case Category::kOther:
      return "Other";
  }
  return "Other";
}

std::optional<Confidence> parse_confidence(const std::string_view text) {
  const std::string lowered = core::normalize_ascii_lower(text);
  if (lowered == "high") {
    return Confidence::kHigh;
  }
  if (lowered == "medium") {
    return Confidence::kMedium;
  }
  if (lowered == "low") {
    return Confidence::kLow;
  }
  return std::nullopt;
}

std::optional<Severity> parse_severity(const std::string_view text) {
  const std::string lowered = core::normalize_ascii_lower(text);
  if (lowered == "high") {
    return Severity::kHigh;
  }
  if (lowered == "medium") {
    return Severity::kMedium;
  }
  if (lowered == "low") {
    return Severity::kLow;
  }
  return std::nullopt;
}

std::optional<RuleKind> parse_rule_kind(const std::string_view text) {
  if (text == "file_absence") {
    return RuleKind::kFileAbsence;
  }
  if (text == "directory_absence") {
    return RuleKind::kDirectoryAbsence;
  }
  if (text == "file_quality") {
    return RuleKind::kFileQuality;
  }
  return std::nullopt;
}

std::optional<Category> parse_category(const std::string_view text) {
  const std::string lowered = core::normalize_ascii_lower(text);
  if (lowered == "git") {
    return Category::kGit;
  }
  if (lowered == "documentation" || lowered == "docs") {
    return Category::kDocumentation;
  }
  if (lowered == "ci_cd" || lowered == "ci/cd" || lowered == "ci") {
    return Category::kCiCd;
  }
  if (lowered == "code_quality" || lowered == "quality") {
    return Category::kCodeQuality;
  }
  if (lowered == "setup") {
    return Category::kSetup;
  }
  if (lowered == "security") {
    return Category::kSecurity;
  }
  if (lowered == "other") {
    return Category::kOther;
  }
  return std::nullopt;
}

Category infer_category(const std::string_view rule_id) {
  const std::string id = core::normalize_ascii_lower(rule_id);
  const auto has = [&id](std::string_view needle) {
    return id.find(needle) != std::string::npos;
  };

  // Checked in this order so "missing-git-hooks" lands in git, not CI/CD.
  if (has("gitignore") || has("git-")) {
    return Category::kGit;
  }
  if (has("readme") || has("contributing") || has("license") || has("changelog")) {
    return Category::kDocumentation;
  }
  if (has("security") || has("secret") || has("env-example") || has("dependabot")) {
    return Category::kSecurity;
  }
  if (has("ci") || has("workflow") || has("docker")) {
    return Category::kCiCd;
  }
  if (has("eslint") || has("prettier") || has("lint") || has("format")) {
    return Category::kCodeQuality;
  }
  if (has("editorconfig") || has("tests") || has("setup")) {
    return Category::kSetup;
  }
  return Category::kOther;
}

}  // namespace catalyst::domain
