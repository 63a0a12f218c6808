#include "catalyst/history/history_record.h"

#include <stdexcept>

namespace catalyst::history {

HistoryRecord make_history_record(const domain::AnalysisReport& report,
                                  const std::string& project_identifier,
                                  const std::string& timestamp) {
  HistoryRecord record;
  record.timestamp = timestamp;
  record.project_identifier = project_identifier;
  record.health_score = report.health_score;
  record.total_patterns = report.summary.total_patterns;
  record.issues_found = report.summary.issues_found;
  record.detections.reserve(report.detections.size());
  for (const auto& detection : report.detections) {
    record.detections.push_back({detection.rule_id, detection.severity, detection.confidence,
                                 detection.priority_score()});
  }
  return record;
}

nlohmann::json record_to_json(const HistoryRecord& record) {
  nlohmann::json detections = nlohmann::json::array();
  for (const auto& summary : record.detections) {
    detections.push_back({{"confidence", domain::to_string(summary.confidence)},
                          {"priority_score", summary.priority_score},
                          {"rule_id", summary.rule_id},
                          {"severity", domain::to_string(summary.severity)}});
  }

  nlohmann::json j;
  j["detections"] = detections;
  j["health_score"] = record.health_score;
  j["isolation"] = {{"domain", record.domain}, {"session_id", record.session_id}};
  j["issues_found"] = record.issues_found;
  j["project_identifier"] = record.project_identifier;
  j["timestamp"] = record.timestamp;
  j["total_patterns"] = record.total_patterns;
  return j;
}

HistoryRecord record_from_json(const nlohmann::json& j) {
  HistoryRecord record;
  record.timestamp = j.at("timestamp").get<std::string>();
  record.project_identifier = j.at("project_identifier").get<std::string>();
  record.health_score = j.at("health_score").get<int>();
  record.total_patterns = j.at("total_patterns").get<std::size_t>();
  record.issues_found = j.at("issues_found").get<std::size_t>();

  for (const auto& item : j.at("detections")) {
    const auto severity = domain::parse_severity(item.at("severity").get<std::string>());
    const auto confidence = domain::parse_confidence(item.at("confidence").get<std::string>());
    if (!severity.has_value() || !confidence.has_value()) {
      throw std::invalid_argument("Invalid severity or confidence in history record");
    }
    record.detections.push_back({item.at("rule_id").get<std::string>(), severity.value(),
                                 confidence.value(), item.at("priority_score").get<double>()});
  }

  const auto& isolation = j.at("isolation");
  record.session_id = isolation.at("session_id").get<std::string>();
  record.domain = isolation.at("domain").get<std::string>();
  return record;
}

}  // namespace catalyst::history
