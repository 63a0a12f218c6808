#pragma once

#include "catalyst/core/clock.h"
#include "catalyst/core/id_generator.h"
#include "catalyst/core/result.h"
#include "catalyst/core/services.h"
#include "catalyst/domain/analysis_report.h"
#include "catalyst/domain/project_snapshot.h"
#include "catalyst/evaluation/rule_evaluator.h"
#include "catalyst/history/history_sink.h"
#include "catalyst/history/trend.h"
#include "catalyst/rules/rule_loader.h"
#include "catalyst/scanning/scan_error.h"
#include "catalyst/scanning/scan_options.h"
#include "catalyst/storage/audit_event.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace catalyst::app {

// ────────────────────────────────────────────────────────────────
// Rule set
// ────────────────────────────────────────────────────────────────

// Loads rules from rules_path, or the built-in set when no path is given.
[[nodiscard]] core::Result<rules::RuleLoadResult, std::string> load_rule_set(
    const std::optional<std::string>& rules_path);

// ────────────────────────────────────────────────────────────────
// Analysis Pipeline
// ────────────────────────────────────────────────────────────────

struct AnalysisRequest {
  std::string root;
  std::optional<std::string> rules_path;  // NOLINT(readability-identifier-naming)
  // Treat any rule load warning as fatal.
  bool strict_rules{false};                 // NOLINT(readability-identifier-naming)
  scanning::ScanOptions scan_options;       // NOLINT(readability-identifier-naming)
  evaluation::EvaluationOptions evaluation;
  // History key; defaults to the snapshot's project name.
  std::optional<std::string> project_identifier;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

enum class AnalysisErrorKind {
  kScanFailed,
  kRulesUnavailable,
  kStrictRulesRejected,
};

struct AnalysisError {
  AnalysisErrorKind kind{AnalysisErrorKind::kScanFailed};
  std::string message;
  std::string trace_id;                         // NOLINT(readability-identifier-naming)
  std::optional<scanning::ScanError> scan_error;  // NOLINT(readability-identifier-naming)
  std::vector<rules::LoadWarning> rule_warnings;  // NOLINT(readability-identifier-naming)
};

struct AnalysisResponse {
  std::string trace_id;                            // NOLINT(readability-identifier-naming)
  domain::AnalysisReport report;
  std::vector<rules::LoadWarning> rule_warnings;   // NOLINT(readability-identifier-naming)
  std::vector<domain::SkippedEntry> skipped_entries;  // NOLINT(readability-identifier-naming)
  std::optional<history::TrendSummary> trend;
  bool history_persisted{false};                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> history_error;       // NOLINT(readability-identifier-naming)
};

// Scan, load rules, evaluate and (when services.history is bound) compare with and append
// to history under the binding's isolation.
//
// History is best-effort: a sink failure is reported in history_error and the report is
// still returned. Scan failures and unusable rule sources are returned as errors.
// Emits audit events: AnalysisStarted, ScanCompleted, RulesLoaded, EvaluationCompleted,
// HistoryPersisted | HistoryPersistFailed, AnalysisCompleted (AnalysisFailed on error).
[[nodiscard]] core::Result<AnalysisResponse, AnalysisError> run_analysis_pipeline(
    const AnalysisRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// Evaluates an already-captured snapshot (e.g. produced by `scan` in another process).
// FileQuality content is read beneath snapshot.root().
[[nodiscard]] domain::AnalysisReport evaluate_snapshot(const domain::ProjectSnapshot& snapshot,
                                                       const rules::RuleLoadResult& rule_set,
                                                       const evaluation::EvaluationOptions& options);

// ────────────────────────────────────────────────────────────────
// History
// ────────────────────────────────────────────────────────────────

// Binds sink to session_id under kHistoryDomain. Fails on an empty or malformed session id,
// before the sink is ever called.
[[nodiscard]] core::Result<history::HistoryBinding, history::IsolationViolation>
bind_history_session(history::IHistorySink& sink, const std::string& session_id);

[[nodiscard]] core::Result<std::vector<history::HistoryRecord>, history::HistoryError>
fetch_history(const std::string& project_identifier, const std::string& session_id,
              std::size_t limit, history::IHistorySink& sink);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace catalyst::app
