#include "catalyst/history/history_record.h"
#include "catalyst/history/trend.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <vector>

using namespace catalyst;

namespace {

domain::Detection detection(const std::string& rule_id, domain::Severity severity) {
  domain::Detection d;
  d.rule_id = rule_id;
  d.issue_found = true;
  d.severity = severity;
  d.confidence = domain::Confidence::kHigh;
  return d;
}

}  // namespace

TEST_CASE("Trend: resolved and new rule ids", "[history][trend]") {
  history::HistoryRecord previous;
  previous.timestamp = "2026-01-01T00:00:00Z";
  previous.health_score = 40;
  previous.detections = {{"missing-readme", domain::Severity::kHigh, domain::Confidence::kHigh, 10.0},
                         {"missing-gitignore", domain::Severity::kHigh, domain::Confidence::kHigh, 10.0},
                         {"missing-license", domain::Severity::kMedium, domain::Confidence::kHigh, 3.0}};

  domain::AnalysisReport report;
  report.health_score = 65;
  report.detections = {detection("missing-license", domain::Severity::kMedium),
                       detection("missing-ci", domain::Severity::kMedium)};

  const auto trend = history::compare_with_history(report, previous);
  CHECK(trend.previous_timestamp == "2026-01-01T00:00:00Z");
  CHECK(trend.previous_score == 40);
  CHECK(trend.current_score == 65);
  CHECK(trend.score_delta == 25);
  CHECK(trend.resolved_rule_ids == std::vector<std::string>{"missing-gitignore", "missing-readme"});
  CHECK(trend.new_rule_ids == std::vector<std::string>{"missing-ci"});
}

TEST_CASE("Trend: unchanged run has zero delta", "[history][trend]") {
  domain::AnalysisReport report;
  report.health_score = 70;
  report.detections = {detection("missing-ci", domain::Severity::kMedium)};

  const auto record = history::make_history_record(report, "demo", "2026-02-02T00:00:00Z");
  const auto trend = history::compare_with_history(report, record);
  CHECK(trend.score_delta == 0);
  CHECK(trend.resolved_rule_ids.empty());
  CHECK(trend.new_rule_ids.empty());
}

TEST_CASE("History record: built from report and serialized", "[history][record]") {
  domain::AnalysisReport report;
  report.health_score = 55;
  report.summary.total_patterns = 9;
  report.summary.issues_found = 2;
  report.detections = {detection("missing-readme", domain::Severity::kHigh),
                       detection("missing-ci", domain::Severity::kMedium)};

  auto record = history::make_history_record(report, "demo", "2026-03-03T12:00:00Z");
  record.session_id = "s-1";
  record.domain = "project-catalyst";
  REQUIRE(record.detections.size() == 2);
  CHECK(record.detections[0].rule_id == "missing-readme");
  CHECK_THAT(record.detections[0].priority_score, Catch::Matchers::WithinAbs(10.0, 1e-9));

  const auto j = history::record_to_json(record);
  CHECK(j["isolation"]["session_id"] == "s-1");
  const auto back = history::record_from_json(j);
  CHECK(back.project_identifier == "demo");
  CHECK(back.total_patterns == 9);
  CHECK(back.issues_found == 2);
  CHECK(back.detections[1].severity == domain::Severity::kMedium);
  CHECK(back.domain == "project-catalyst");

  auto bad = j;
  bad["detections"][0]["severity"] = "catastrophic";
  CHECK_THROWS_AS(history::record_from_json(bad), std::invalid_argument);
}
