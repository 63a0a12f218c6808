#include "catalyst/evaluation/rule_evaluator.h"
#include "catalyst/rules/rule_loader.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace catalyst;

namespace {

std::vector<rules::Rule> rules_from(std::string_view source) {
  auto loaded = rules::load_rules(source);
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().warnings.empty());
  return loaded.value().rules;
}

rules::Rule single_rule(std::string_view source) {
  auto rules = rules_from(source);
  REQUIRE(rules.size() == 1);
  return rules.front();
}

const char* const kReadmeQuality = R"({"rules": [{
  "id": "readme-minimal", "kind": "file_quality", "target": "README.md",
  "confidence": "medium", "severity": "medium",
  "quality_criteria": {"min_lines": 50, "required_sections": ["## Installation", "## Usage"]}
}]})";

std::string readme_with_sections(std::size_t total_lines) {
  return "## Installation\n## Usage\n" + test::repeat_lines(total_lines - 2);
}

}  // namespace

TEST_CASE("Evaluator: file absence with any-of candidates", "[evaluator]") {
  const auto rule = single_rule(R"({"rules": [{
    "id": "missing-license", "kind": "file_absence",
    "target": ["LICENSE", "LICENSE.txt", "LICENSE.md"], "confidence": "high", "severity": "medium"
  }]})");
  const evaluation::InMemoryContentSource content;
  const evaluation::RuleEvaluator evaluator;

  SECTION("no candidate present") {
    const domain::ProjectSnapshot snapshot(test::snapshot_data({"README.md"}));
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK(detection->issue_found);
    CHECK_FALSE(detection->evidence.matched_candidate.has_value());
    CHECK(detection->confidence == domain::Confidence::kHigh);
  }

  SECTION("a later candidate satisfies the rule") {
    const domain::ProjectSnapshot snapshot(test::snapshot_data({"LICENSE.md"}));
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK_FALSE(detection->issue_found);
    CHECK(detection->evidence.matched_candidate == std::optional<std::string>("LICENSE.md"));
  }

  SECTION("a directory with the candidate name does not satisfy a file check") {
    const domain::ProjectSnapshot snapshot(test::snapshot_data({}, {"LICENSE"}));
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK(detection->issue_found);
  }
}

TEST_CASE("Evaluator: directory absence", "[evaluator]") {
  const auto rule = single_rule(R"({"rules": [{
    "id": "missing-tests-dir", "kind": "directory_absence", "target": ["tests", "test", "spec"]
  }]})");
  const evaluation::InMemoryContentSource content;
  const evaluation::RuleEvaluator evaluator;

  const domain::ProjectSnapshot with_dir(test::snapshot_data({}, {"spec"}));
  const auto found = evaluator.evaluate_rule(with_dir, rule, content);
  REQUIRE(found.has_value());
  CHECK_FALSE(found->issue_found);
  CHECK(found->evidence.matched_candidate == std::optional<std::string>("spec"));

  const domain::ProjectSnapshot with_file(test::snapshot_data({"test"}));
  const auto file = evaluator.evaluate_rule(with_file, rule, content);
  REQUIRE(file.has_value());
  CHECK_FALSE(file->issue_found);
  REQUIRE(file->evidence.notes.size() == 1);
  CHECK(file->evidence.notes[0] == "satisfied by a file at test");

  const domain::ProjectSnapshot nested(test::snapshot_data({}, {"src/tests"}));
  const auto absent = evaluator.evaluate_rule(nested, rule, content);
  REQUIRE(absent.has_value());
  CHECK(absent->issue_found);
}

TEST_CASE("Evaluator: file quality line threshold boundary", "[evaluator][quality]") {
  const auto rule = single_rule(kReadmeQuality);
  const domain::ProjectSnapshot snapshot(test::snapshot_data({"README.md"}));
  const evaluation::RuleEvaluator evaluator;

  SECTION("exactly min_lines with all sections passes") {
    evaluation::InMemoryContentSource content;
    content.put("README.md", readme_with_sections(50));
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK_FALSE(detection->issue_found);
    CHECK(detection->evidence.line_count == std::optional<std::size_t>(50));
    CHECK(detection->evidence.missing_sections.empty());
  }

  SECTION("one line short is an issue and a marginal near miss") {
    evaluation::InMemoryContentSource content;
    content.put("README.md", readme_with_sections(49));
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK(detection->issue_found);
    CHECK(detection->evidence.line_count == std::optional<std::size_t>(49));
    CHECK(detection->evidence.min_lines == std::optional<std::size_t>(50));
    CHECK(detection->evidence.marginal_quality);
    // Confidence stays as declared.
    CHECK(detection->confidence == domain::Confidence::kMedium);
  }

  SECTION("far below the minimum is not marginal") {
    evaluation::InMemoryContentSource content;
    content.put("README.md", readme_with_sections(10));
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK(detection->issue_found);
    CHECK_FALSE(detection->evidence.marginal_quality);
  }

  SECTION("missing sections are an issue regardless of length") {
    evaluation::InMemoryContentSource content;
    content.put("README.md", "## Installation\n" + test::repeat_lines(80));
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK(detection->issue_found);
    CHECK(detection->evidence.matched_sections == std::vector<std::string>{"## Installation"});
    CHECK(detection->evidence.missing_sections == std::vector<std::string>{"## Usage"});
    CHECK_FALSE(detection->evidence.marginal_quality);
  }
}

TEST_CASE("Evaluator: unreadable or absent quality target", "[evaluator][quality]") {
  const auto rule = single_rule(kReadmeQuality);
  const evaluation::RuleEvaluator evaluator;

  SECTION("read failure is a positive detection with read_error") {
    const domain::ProjectSnapshot snapshot(test::snapshot_data({"README.md"}));
    evaluation::InMemoryContentSource content;
    content.put_error("README.md", "Permission denied");
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK(detection->issue_found);
    CHECK(detection->evidence.read_error == std::optional<std::string>("Permission denied"));
    CHECK_FALSE(detection->evidence.line_count.has_value());
  }

  SECTION("absent target is an issue") {
    const domain::ProjectSnapshot snapshot(test::snapshot_data({}));
    const evaluation::InMemoryContentSource content;
    const auto detection = evaluator.evaluate_rule(snapshot, rule, content);
    REQUIRE(detection.has_value());
    CHECK(detection->issue_found);
    CHECK_FALSE(detection->evidence.read_error.has_value());
  }
}

TEST_CASE("Evaluator: applies_when excludes a rule from the report", "[evaluator]") {
  const auto rules = rules_from(R"({"rules": [
    {"id": "missing-eslint", "kind": "file_absence", "target": ".eslintrc",
     "applies_when": {"project_type": "node"}},
    {"id": "missing-editorconfig", "kind": "file_absence", "target": ".editorconfig"}
  ]})");
  const evaluation::InMemoryContentSource content;
  const evaluation::RuleEvaluator evaluator;

  auto data = test::snapshot_data({"requirements.txt"});
  data.project_types = {domain::ProjectType::kPython};
  const domain::ProjectSnapshot snapshot(std::move(data));

  CHECK_FALSE(evaluator.evaluate_rule(snapshot, rules[0], content).has_value());

  const auto report = evaluator.evaluate(snapshot, rules, content, "1.0");
  CHECK(report.summary.total_patterns == 1);
  CHECK(report.summary.issues_found == 1);
  REQUIRE(report.detections.size() == 1);
  CHECK(report.detections[0].rule_id == "missing-editorconfig");
  REQUIRE(report.checks.size() == 1);
  CHECK(report.rule_set_version == "1.0");
}

TEST_CASE("Evaluator: detections ordered by priority then rule id", "[evaluator]") {
  // Two high/high rules tie at 10.0; medium/medium scores 2.1; high/low 0.6.
  const auto rules = rules_from(R"({"rules": [
    {"id": "zeta", "kind": "file_absence", "target": "Z", "confidence": "high", "severity": "low"},
    {"id": "beta", "kind": "file_absence", "target": "B", "confidence": "high", "severity": "high"},
    {"id": "mid", "kind": "file_absence", "target": "M"},
    {"id": "alpha", "kind": "file_absence", "target": "A", "confidence": "high", "severity": "high"},
    {"id": "present", "kind": "file_absence", "target": "P", "confidence": "high", "severity": "high"}
  ]})");
  const domain::ProjectSnapshot snapshot(test::snapshot_data({"P"}));
  const evaluation::InMemoryContentSource content;
  const auto report = evaluation::RuleEvaluator().evaluate(snapshot, rules, content);

  REQUIRE(report.detections.size() == 4);
  CHECK(report.detections[0].rule_id == "alpha");
  CHECK(report.detections[1].rule_id == "beta");
  CHECK(report.detections[2].rule_id == "mid");
  CHECK(report.detections[3].rule_id == "zeta");
  CHECK(report.detections[0].priority_score() == 10.0);

  CHECK(report.summary.total_patterns == 5);
  CHECK(report.summary.issues_found == 4);
  CHECK(report.summary.high_severity == 2);
  CHECK(report.summary.medium_severity == 1);
  CHECK(report.summary.low_severity == 1);
  // floor((500 - 400 - 50 * 5) / 5) is negative, clamped to 0.
  CHECK(report.health_score == 0);

  REQUIRE(report.checks.size() == 5);
  CHECK(report.checks.front().rule_id == "alpha");
  CHECK(report.checks.back().rule_id == "zeta");
}

TEST_CASE("Evaluator: recommendation variants", "[evaluator][recommendation]") {
  const auto rule = single_rule(R"({"rules": [{
    "id": "missing-ci-workflow", "kind": "file_absence", "target": ".github/workflows/ci.yml",
    "recommendation": {"template": "ci/generic", "reason": "automate checks", "variants": [
      {"when": "package.json exists", "template": "ci/node"},
      {"when": "requirements.txt or pyproject.toml exists", "template": "ci/python"}
    ]}
  }]})");

  const domain::ProjectSnapshot both(test::snapshot_data({"package.json", "pyproject.toml"}));
  const auto first = evaluation::resolve_recommendation(rule, both);
  REQUIRE(first.has_value());
  CHECK(first->template_id == "ci/node");
  CHECK(first->variant_applied);
  CHECK(first->reason == "automate checks");

  const domain::ProjectSnapshot python(test::snapshot_data({"pyproject.toml"}));
  CHECK(evaluation::resolve_recommendation(rule, python)->template_id == "ci/python");

  const domain::ProjectSnapshot neither(test::snapshot_data({"go.mod"}));
  const auto fallback = evaluation::resolve_recommendation(rule, neither);
  REQUIRE(fallback.has_value());
  CHECK(fallback->template_id == "ci/generic");
  CHECK_FALSE(fallback->variant_applied);

  const evaluation::InMemoryContentSource content;
  const auto detection = evaluation::RuleEvaluator().evaluate_rule(python, rule, content);
  REQUIRE(detection.has_value());
  REQUIRE(detection->recommendation.has_value());
  CHECK(detection->recommendation->template_id == "ci/python");
}

TEST_CASE("Evaluator: built-in rules against an empty project", "[evaluator]") {
  const auto loaded = rules::load_rules(rules::default_rule_source());
  REQUIRE(loaded.has_value());
  const domain::ProjectSnapshot snapshot(test::snapshot_data({}));
  const evaluation::InMemoryContentSource content;

  const auto report =
      evaluation::RuleEvaluator().evaluate(snapshot, loaded.value().rules, content, "1.0");

  // Excluded: readme-minimal (no README), missing-eslint and missing-prettier (not node),
  // missing-env-example (no node/python/php).
  CHECK(report.summary.total_patterns == 9);
  CHECK(report.summary.issues_found == 9);
  CHECK(report.health_score == 0);
  REQUIRE_FALSE(report.detections.empty());
  CHECK(report.detections.front().rule_id == "missing-gitignore");
}
