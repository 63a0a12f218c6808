#pragma once

#include <string>
#include <vector>

namespace catalyst::storage {

// Event types emitted by the analysis pipeline, in the order they occur.
inline constexpr const char* kEventAnalysisStarted = "AnalysisStarted";
inline constexpr const char* kEventScanCompleted = "ScanCompleted";
inline constexpr const char* kEventRulesLoaded = "RulesLoaded";
inline constexpr const char* kEventEvaluationCompleted = "EvaluationCompleted";
inline constexpr const char* kEventHistoryPersisted = "HistoryPersisted";
inline constexpr const char* kEventHistoryPersistFailed = "HistoryPersistFailed";
inline constexpr const char* kEventAnalysisCompleted = "AnalysisCompleted";
inline constexpr const char* kEventAnalysisFailed = "AnalysisFailed";

struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;  // JSON object text
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace catalyst::storage
