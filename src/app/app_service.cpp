#include "catalyst/app/app_service.h"

#include "catalyst/core/ids.h"
#include "catalyst/evaluation/content_source.h"
#include "catalyst/history/history_record.h"
#include "catalyst/scanning/structure_scanner.h"

#include <nlohmann/json.hpp>

namespace catalyst::app {

namespace {

void emit(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const char* event_type, const nlohmann::json& payload,
          std::vector<std::string> refs = {}) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

using PipelineResult = core::Result<AnalysisResponse, AnalysisError>;

PipelineResult fail(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
                    AnalysisError error) {
  emit(services, id_gen, clock, error.trace_id, storage::kEventAnalysisFailed,
       {{"message", error.message}});
  return PipelineResult::err(std::move(error));
}

// Reads the latest record (for the trend) and appends the new one, both under the
// binding's isolation.
void record_history(const history::HistoryBinding& binding, const std::string& project_identifier,
                    AnalysisResponse& response, core::Services& services,
                    core::IIdGenerator& id_gen, core::IClock& clock) {
  history::IHistorySink& sink = binding.sink();
  const history::IsolationContext& isolation = binding.isolation();

  const auto previous = sink.history(history::HistoryQuery(project_identifier, isolation, 1));
  if (previous.has_value() && !previous.value().empty()) {
    response.trend = history::compare_with_history(response.report, previous.value().front());
  }

  auto record =
      history::make_history_record(response.report, project_identifier, clock.now_iso8601());
  const auto put = sink.put(history::PutHistoryRequest(std::move(record), isolation));
  if (put.has_value()) {
    response.history_persisted = true;
    emit(services, id_gen, clock, response.trace_id, storage::kEventHistoryPersisted,
         {{"backend", sink.backend_name()}, {"project_identifier", project_identifier}},
         {project_identifier});
    return;
  }

  response.history_error = put.error().message;
  emit(services, id_gen, clock, response.trace_id, storage::kEventHistoryPersistFailed,
       {{"backend", sink.backend_name()},
        {"isolation_violation", put.error().kind == history::HistoryErrorKind::kIsolationViolation},
        {"message", put.error().message}},
       {project_identifier});
}

}  // namespace

core::Result<rules::RuleLoadResult, std::string> load_rule_set(
    const std::optional<std::string>& rules_path) {
  if (rules_path.has_value()) {
    return rules::load_rules_file(rules_path.value());
  }
  return rules::load_rules(rules::default_rule_source());
}

domain::AnalysisReport evaluate_snapshot(const domain::ProjectSnapshot& snapshot,
                                         const rules::RuleLoadResult& rule_set,
                                         const evaluation::EvaluationOptions& options) {
  const evaluation::FilesystemContentSource content(snapshot.root());
  const evaluation::RuleEvaluator evaluator(options);
  return evaluator.evaluate(snapshot, rule_set.rules, content, rule_set.version);
}

PipelineResult run_analysis_pipeline(const AnalysisRequest& req, core::Services& services,
                                     core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id =
      req.trace_id.has_value() ? req.trace_id.value() : core::new_trace_id(id_gen).value;

  emit(services, id_gen, clock, trace_id, storage::kEventAnalysisStarted,
       {{"root", req.root},
        {"rules", req.rules_path.value_or("built-in")},
        {"scan_workers", req.scan_options.max_workers},
        {"evaluation_workers", req.evaluation.workers}});

  // ── Scan ───────────────────────────────────────────────────────
  auto scanned = scanning::scan(req.root, req.scan_options);
  if (!scanned.has_value()) {
    const auto& scan_error = scanned.error();
    AnalysisError error;
    error.kind = AnalysisErrorKind::kScanFailed;
    error.message = scan_error.message + ": " + scan_error.path;
    error.trace_id = trace_id;
    error.scan_error = scan_error;
    return fail(services, id_gen, clock, std::move(error));
  }
  const domain::ProjectSnapshot& snapshot = scanned.value();

  emit(services, id_gen, clock, trace_id, storage::kEventScanCompleted,
       {{"directories", snapshot.directories().size()},
        {"files", snapshot.files().size()},
        {"project_name", snapshot.project_name()},
        {"skipped_entries", snapshot.skipped_entries().size()}});

  // ── Rules ──────────────────────────────────────────────────────
  auto loaded = load_rule_set(req.rules_path);
  if (!loaded.has_value()) {
    AnalysisError error;
    error.kind = AnalysisErrorKind::kRulesUnavailable;
    error.message = loaded.error();
    error.trace_id = trace_id;
    return fail(services, id_gen, clock, std::move(error));
  }
  const rules::RuleLoadResult& rule_set = loaded.value();

  emit(services, id_gen, clock, trace_id, storage::kEventRulesLoaded,
       {{"rules", rule_set.rules.size()},
        {"version", rule_set.version},
        {"warnings", rule_set.warnings.size()}});

  if (req.strict_rules && !rule_set.warnings.empty()) {
    AnalysisError error;
    error.kind = AnalysisErrorKind::kStrictRulesRejected;
    error.message = std::to_string(rule_set.warnings.size()) +
                    " rule definition(s) rejected in strict mode";
    error.trace_id = trace_id;
    error.rule_warnings = rule_set.warnings;
    return fail(services, id_gen, clock, std::move(error));
  }

  // ── Evaluate ───────────────────────────────────────────────────
  AnalysisResponse response;
  response.trace_id = trace_id;
  response.report = evaluate_snapshot(snapshot, rule_set, req.evaluation);
  response.rule_warnings = rule_set.warnings;
  response.skipped_entries = snapshot.skipped_entries();

  emit(services, id_gen, clock, trace_id, storage::kEventEvaluationCompleted,
       {{"health_score", response.report.health_score},
        {"issues_found", response.report.summary.issues_found},
        {"total_patterns", response.report.summary.total_patterns}});

  // ── History (best-effort) ──────────────────────────────────────
  const std::string project_identifier =
      req.project_identifier.value_or(response.report.project_name);
  if (services.history.has_value()) {
    record_history(services.history.value(), project_identifier, response, services, id_gen,
                   clock);
  }

  emit(services, id_gen, clock, trace_id, storage::kEventAnalysisCompleted,
       {{"health_score", response.report.health_score},
        {"history_persisted", response.history_persisted}});

  return PipelineResult::ok(std::move(response));
}

core::Result<history::HistoryBinding, history::IsolationViolation> bind_history_session(
    history::IHistorySink& sink, const std::string& session_id) {
  return history::HistoryBinding::bind(
      sink, history::IsolationContext(session_id, std::string(history::kHistoryDomain)));
}

core::Result<std::vector<history::HistoryRecord>, history::HistoryError> fetch_history(
    const std::string& project_identifier, const std::string& session_id,
    const std::size_t limit, history::IHistorySink& sink) {
  const history::IsolationContext isolation(session_id, std::string(history::kHistoryDomain));
  return sink.history(history::HistoryQuery(project_identifier, isolation, limit));
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace catalyst::app
