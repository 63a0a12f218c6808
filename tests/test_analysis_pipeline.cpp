#include "catalyst/app/app_service.h"
#include "catalyst/core/clock.h"
#include "catalyst/core/id_generator.h"
#include "catalyst/history/inmemory_history_sink.h"
#include "catalyst/storage/audit_log.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace catalyst;

namespace {

constexpr const char* kNotesRules = R"({"version": "3", "rules": [
    {"id": "missing-notes", "kind": "file_absence", "target": "NOTES.md",
     "severity": "high", "confidence": "high", "category": "documentation"}]})";

// Counts how often the backend hooks are reached and which isolation they saw.
class CountingSink final : public history::IHistorySink {
 public:
  [[nodiscard]] std::string backend_name() const override { return "counting"; }

  int puts{0};
  mutable int reads{0};
  std::vector<std::string> sessions;

 protected:
  core::Result<bool, history::HistoryError> do_put(
      const history::HistoryRecord& /*record*/,
      const history::IsolationContext& isolation) override {
    ++puts;
    sessions.push_back(isolation.session_id());
    return core::Result<bool, history::HistoryError>::ok(true);
  }

  [[nodiscard]] core::Result<std::vector<history::HistoryRecord>, history::HistoryError>
  do_history(const history::HistoryQuery& /*query*/) const override {
    ++reads;
    return core::Result<std::vector<history::HistoryRecord>, history::HistoryError>::ok({});
  }
};

history::HistoryBinding bind_session(history::IHistorySink& sink, const std::string& session_id) {
  auto bound = app::bind_history_session(sink, session_id);
  REQUIRE(bound.has_value());
  return bound.value();
}

std::vector<std::string> event_types(const std::vector<storage::AuditEvent>& events) {
  std::vector<std::string> types;
  for (const auto& event : events) {
    types.push_back(event.event_type);
  }
  return types;
}

}  // namespace

TEST_CASE("Pipeline: analysis with history and trend", "[pipeline]") {
  const test::TempProject project("notes-app");
  project.write("README.md", "# notes-app\n");
  const test::TempProject config("config");
  config.write("rules.json", kNotesRules);

  storage::InMemoryAuditLog audit_log;
  history::InMemoryHistorySink sink;
  core::Services services(audit_log, bind_session(sink, "session-1"));
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-05-01T10:00:00Z");

  app::AnalysisRequest req;
  req.root = project.root();
  req.rules_path = config.root() + "/rules.json";

  const auto first = app::run_analysis_pipeline(req, services, id_gen, clock);
  REQUIRE(first.has_value());
  const auto& report = first.value().report;
  CHECK(first.value().trace_id == "trace-0");
  CHECK(report.project_name == "notes-app");
  CHECK(report.rule_set_version == "3");
  CHECK(report.summary.total_patterns == 1);
  CHECK(report.summary.issues_found == 1);
  REQUIRE(report.detections.size() == 1);
  CHECK(report.detections[0].rule_id == "missing-notes");
  CHECK(first.value().history_persisted);
  CHECK_FALSE(first.value().trend.has_value());
  CHECK(sink.size() == 1);

  CHECK(event_types(app::fetch_audit_trace("trace-0", services)) ==
        std::vector<std::string>{storage::kEventAnalysisStarted, storage::kEventScanCompleted,
                                 storage::kEventRulesLoaded, storage::kEventEvaluationCompleted,
                                 storage::kEventHistoryPersisted,
                                 storage::kEventAnalysisCompleted});

  project.write("NOTES.md", "done\n");
  const auto second = app::run_analysis_pipeline(req, services, id_gen, clock);
  REQUIRE(second.has_value());
  CHECK(second.value().report.health_score == 100);
  REQUIRE(second.value().trend.has_value());
  CHECK(second.value().trend->previous_score == report.health_score);
  CHECK(second.value().trend->score_delta == 100 - report.health_score);
  CHECK(second.value().trend->resolved_rule_ids == std::vector<std::string>{"missing-notes"});
  CHECK(second.value().trend->new_rule_ids.empty());

  const auto stored = app::fetch_history("notes-app", "session-1", 10, sink);
  REQUIRE(stored.has_value());
  REQUIRE(stored.value().size() == 2);
  CHECK(stored.value()[0].health_score == 100);

  // Another session sees nothing of session-1.
  const auto foreign = app::fetch_history("notes-app", "session-2", 10, sink);
  REQUIRE(foreign.has_value());
  CHECK(foreign.value().empty());
}

TEST_CASE("Pipeline: explicit project identifier and trace id", "[pipeline]") {
  const test::TempProject project("svc");
  storage::InMemoryAuditLog audit_log;
  history::InMemoryHistorySink sink;
  core::Services services(audit_log, bind_session(sink, "s"));
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-05-01T10:00:00Z");

  app::AnalysisRequest req;
  req.root = project.root();
  req.project_identifier = "acme/svc";
  req.trace_id = "trace-custom";

  const auto result = app::run_analysis_pipeline(req, services, id_gen, clock);
  REQUIRE(result.has_value());
  CHECK(result.value().trace_id == "trace-custom");
  CHECK(result.value().report.rule_set_version == "1.0");

  const auto stored = app::fetch_history("acme/svc", "s", 5, sink);
  REQUIRE(stored.has_value());
  CHECK(stored.value().size() == 1);
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-custom"});
}

TEST_CASE("Pipeline: a sink cannot be bound without a usable session", "[pipeline][history]") {
  CountingSink sink;

  SECTION("missing session id") {
    const auto bound = app::bind_history_session(sink, "");
    REQUIRE_FALSE(bound.has_value());
    CHECK(bound.error().kind == history::IsolationViolationKind::kMissingSessionId);
  }

  SECTION("malformed session id") {
    const auto bound = app::bind_history_session(sink, "two words");
    REQUIRE_FALSE(bound.has_value());
    CHECK(bound.error().kind == history::IsolationViolationKind::kMalformedSessionId);
  }

  CHECK(sink.puts == 0);
  CHECK(sink.reads == 0);
}

TEST_CASE("Pipeline: history calls carry the bound session", "[pipeline][history]") {
  const test::TempProject project("bound");
  storage::InMemoryAuditLog audit_log;
  CountingSink sink;
  core::Services services(audit_log, bind_session(sink, "s-9"));
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-05-01T10:00:00Z");

  app::AnalysisRequest req;
  req.root = project.root();

  const auto result = app::run_analysis_pipeline(req, services, id_gen, clock);
  REQUIRE(result.has_value());
  CHECK(result.value().history_persisted);
  CHECK(sink.reads == 1);
  CHECK(sink.sessions == std::vector<std::string>{"s-9"});
}

TEST_CASE("Pipeline: no history sink configured", "[pipeline]") {
  const test::TempProject project("plain");
  storage::InMemoryAuditLog audit_log;
  core::Services services(audit_log);
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-05-01T10:00:00Z");

  app::AnalysisRequest req;
  req.root = project.root();
  const auto result = app::run_analysis_pipeline(req, services, id_gen, clock);
  REQUIRE(result.has_value());
  CHECK_FALSE(result.value().history_persisted);
  CHECK_FALSE(result.value().history_error.has_value());
  CHECK(audit_log.query("").size() == 5);
}

TEST_CASE("Pipeline: failures", "[pipeline][errors]") {
  storage::InMemoryAuditLog audit_log;
  core::Services services(audit_log);
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-05-01T10:00:00Z");

  SECTION("missing root") {
    const test::TempProject scratch("gone");
    app::AnalysisRequest req;
    req.root = scratch.root() + "/does-not-exist";

    const auto result = app::run_analysis_pipeline(req, services, id_gen, clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == app::AnalysisErrorKind::kScanFailed);
    REQUIRE(result.error().scan_error.has_value());
    CHECK(result.error().scan_error->kind == scanning::ScanErrorKind::kNotFound);

    const auto types = event_types(audit_log.query(result.error().trace_id));
    CHECK(types == std::vector<std::string>{storage::kEventAnalysisStarted,
                                            storage::kEventAnalysisFailed});
  }

  SECTION("unreadable rules file") {
    const test::TempProject project("rules-missing");
    app::AnalysisRequest req;
    req.root = project.root();
    req.rules_path = project.root() + "/nope.json";

    const auto result = app::run_analysis_pipeline(req, services, id_gen, clock);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == app::AnalysisErrorKind::kRulesUnavailable);
  }

  SECTION("strict mode rejects a rule set with warnings") {
    const test::TempProject project("strict");
    const test::TempProject config("strict-config");
    config.write("rules.json", R"({"rules": [
        {"id": "ok", "kind": "file_absence", "target": "A.md"},
        {"id": "bad", "kind": "teleport", "target": "B.md"}]})");

    app::AnalysisRequest req;
    req.root = project.root();
    req.rules_path = config.root() + "/rules.json";

    req.strict_rules = true;
    const auto strict = app::run_analysis_pipeline(req, services, id_gen, clock);
    REQUIRE_FALSE(strict.has_value());
    CHECK(strict.error().kind == app::AnalysisErrorKind::kStrictRulesRejected);
    CHECK(strict.error().rule_warnings.size() == 1);

    req.strict_rules = false;
    const auto lenient = app::run_analysis_pipeline(req, services, id_gen, clock);
    REQUIRE(lenient.has_value());
    CHECK(lenient.value().rule_warnings.size() == 1);
    CHECK(lenient.value().report.summary.total_patterns == 1);
  }
}

TEST_CASE("Pipeline: evaluate_snapshot reads content beneath the snapshot root",
          "[pipeline][snapshot]") {
  const test::TempProject project("offline");
  project.write("CONTRIBUTING.md", test::repeat_lines(3));

  auto data = test::snapshot_data({"CONTRIBUTING.md"});
  data.root = project.root();
  const domain::ProjectSnapshot snapshot{data};

  const auto rule_set = app::load_rule_set(std::nullopt);
  REQUIRE(rule_set.has_value());
  const auto report = app::evaluate_snapshot(snapshot, rule_set.value(), {});
  CHECK(report.project_name == "demo");
  CHECK(report.summary.total_patterns > 0);
  const bool absence_flagged =
      std::any_of(report.detections.begin(), report.detections.end(),
                  [](const domain::Detection& d) { return d.rule_id == "missing-contributing"; });
  CHECK_FALSE(absence_flagged);
}
