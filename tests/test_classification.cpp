#include "catalyst/domain/classification.h"

#include <catch2/catch_test_macros.hpp>

using namespace catalyst::domain;

TEST_CASE("Classification: wire names round trip", "[classification]") {
  for (const auto c : {Confidence::kLow, Confidence::kMedium, Confidence::kHigh}) {
    CHECK(parse_confidence(to_string(c)) == c);
  }
  for (const auto s : {Severity::kLow, Severity::kMedium, Severity::kHigh}) {
    CHECK(parse_severity(to_string(s)) == s);
  }
  for (const auto k : {RuleKind::kFileAbsence, RuleKind::kDirectoryAbsence, RuleKind::kFileQuality}) {
    CHECK(parse_rule_kind(to_string(k)) == k);
  }
  CHECK(to_string(RuleKind::kFileQuality) == "file_quality");
  CHECK_FALSE(parse_confidence("HIGH").has_value());
  CHECK_FALSE(parse_severity("critical").has_value());
}

TEST_CASE("Classification: category aliases and labels", "[classification]") {
  CHECK(parse_category("ci_cd") == Category::kCiCd);
  CHECK(parse_category("ci") == Category::kCiCd);
  CHECK(parse_category("docs") == Category::kDocumentation);
  CHECK(parse_category("quality") == Category::kCodeQuality);
  CHECK_FALSE(parse_category("misc").has_value());
  CHECK(category_label(Category::kGit) == "Git Configuration");
  CHECK(category_label(Category::kCiCd) == "CI/CD");
}

TEST_CASE("Classification: category inference from rule ids", "[classification]") {
  CHECK(infer_category("missing-gitignore") == Category::kGit);
  CHECK(infer_category("missing-git-hooks") == Category::kGit);
  CHECK(infer_category("readme-minimal") == Category::kDocumentation);
  CHECK(infer_category("missing-license") == Category::kDocumentation);
  CHECK(infer_category("missing-ci-workflow") == Category::kCiCd);
  CHECK(infer_category("missing-dockerfile") == Category::kCiCd);
  CHECK(infer_category("missing-prettier") == Category::kCodeQuality);
  CHECK(infer_category("missing-editorconfig") == Category::kSetup);
  CHECK(infer_category("missing-security-policy") == Category::kSecurity);
  CHECK(infer_category("something-else") == Category::kOther);
}
