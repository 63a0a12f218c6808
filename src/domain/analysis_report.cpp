#include "catalyst/domain/analysis_report.h"

#include <stdexcept>

namespace catalyst::domain {

namespace {

template <typename Enum, typename Parser>
Enum parse_or_throw(const nlohmann::json& j, const char* key, Parser parser) {
  const auto text = j.at(key).get<std::string>();
  const auto parsed = parser(text);
  if (!parsed.has_value()) {
    throw std::invalid_argument(std::string("Invalid ") + key + ": " + text);
  }
  return parsed.value();
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = value.value();
  } else {
    j[key] = nullptr;
  }
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<T>();
}

nlohmann::json evidence_to_json(const Evidence& evidence) {
  nlohmann::json j;
  put_optional(j, "line_count", evidence.line_count);
  j["marginal_quality"] = evidence.marginal_quality;
  put_optional(j, "matched_candidate", evidence.matched_candidate);
  j["matched_sections"] = evidence.matched_sections;
  put_optional(j, "min_lines", evidence.min_lines);
  j["missing_sections"] = evidence.missing_sections;
  j["notes"] = evidence.notes;
  put_optional(j, "read_error", evidence.read_error);
  return j;
}

Evidence evidence_from_json(const nlohmann::json& j) {
  Evidence evidence;
  evidence.line_count = get_optional<std::size_t>(j, "line_count");
  evidence.marginal_quality = j.value("marginal_quality", false);
  evidence.matched_candidate = get_optional<std::string>(j, "matched_candidate");
  evidence.matched_sections = j.value("matched_sections", std::vector<std::string>{});
  evidence.min_lines = get_optional<std::size_t>(j, "min_lines");
  evidence.missing_sections = j.value("missing_sections", std::vector<std::string>{});
  evidence.notes = j.value("notes", std::vector<std::string>{});
  evidence.read_error = get_optional<std::string>(j, "read_error");
  return evidence;
}

}  // namespace

nlohmann::json detection_to_json(const Detection& detection) {
  nlohmann::json j;
  j["category"] = to_string(detection.category);
  j["confidence"] = to_string(detection.confidence);
  j["evidence"] = evidence_to_json(detection.evidence);
  j["issue_found"] = detection.issue_found;
  j["kind"] = to_string(detection.kind);
  j["priority_score"] = detection.priority_score();
  if (detection.recommendation.has_value()) {
    j["recommendation"] = {{"reason", detection.recommendation->reason},
                           {"template", detection.recommendation->template_id},
                           {"variant_applied", detection.recommendation->variant_applied}};
  } else {
    j["recommendation"] = nullptr;
  }
  j["rule_id"] = detection.rule_id;
  j["severity"] = to_string(detection.severity);
  j["title"] = detection.title;
  return j;
}

Detection detection_from_json(const nlohmann::json& j) {
  Detection detection;
  detection.rule_id = j.at("rule_id").get<std::string>();
  detection.kind = parse_or_throw<RuleKind>(j, "kind", parse_rule_kind);
  detection.issue_found = j.at("issue_found").get<bool>();
  detection.confidence = parse_or_throw<Confidence>(j, "confidence", parse_confidence);
  detection.severity = parse_or_throw<Severity>(j, "severity", parse_severity);
  detection.category = parse_or_throw<Category>(j, "category", parse_category);
  detection.title = j.value("title", detection.rule_id);
  if (j.contains("evidence")) {
    detection.evidence = evidence_from_json(j.at("evidence"));
  }
  if (j.contains("recommendation") && !j.at("recommendation").is_null()) {
    const auto& rec = j.at("recommendation");
    detection.recommendation =
        ResolvedRecommendation{rec.at("template").get<std::string>(),
                               rec.value("reason", std::string{}),
                               rec.value("variant_applied", false)};
  }
  return detection;
}

nlohmann::json report_to_json(const AnalysisReport& report) {
  using json = nlohmann::json;

  json detections = json::array();
  for (const auto& detection : report.detections) {
    detections.push_back(detection_to_json(detection));
  }

  json checks = json::array();
  for (const auto& check : report.checks) {
    checks.push_back({{"category", to_string(check.category)},
                      {"issue_found", check.issue_found},
                      {"rule_id", check.rule_id},
                      {"severity", to_string(check.severity)}});
  }

  json types = json::array();
  for (const auto type : report.project_types) {
    types.push_back(to_string(type));
  }

  json summary;
  summary["high_severity"] = report.summary.high_severity;
  summary["issues_found"] = report.summary.issues_found;
  summary["low_severity"] = report.summary.low_severity;
  summary["medium_severity"] = report.summary.medium_severity;
  summary["total_patterns"] = report.summary.total_patterns;

  json j;
  j["checks"] = std::move(checks);
  j["detections"] = std::move(detections);
  j["frameworks"] = report.frameworks;
  j["health_score"] = report.health_score;
  j["project_name"] = report.project_name;
  j["project_types"] = std::move(types);
  j["rule_set_version"] = report.rule_set_version;
  j["summary"] = std::move(summary);
  return j;
}

AnalysisReport report_from_json(const nlohmann::json& j) {
  AnalysisReport report;
  report.project_name = j.at("project_name").get<std::string>();
  report.rule_set_version = j.value("rule_set_version", std::string{});
  report.frameworks = j.at("frameworks").get<std::set<std::string>>();
  report.health_score = j.at("health_score").get<int>();

  for (const auto& tag : j.at("project_types")) {
    const auto name = tag.get<std::string>();
    const auto type = parse_project_type(name);
    if (!type.has_value()) {
      throw std::invalid_argument("Unknown project type: " + name);
    }
    report.project_types.insert(type.value());
  }

  for (const auto& d : j.at("detections")) {
    report.detections.push_back(detection_from_json(d));
  }

  for (const auto& c : j.at("checks")) {
    CheckOutcome check;
    check.rule_id = c.at("rule_id").get<std::string>();
    check.category = parse_or_throw<Category>(c, "category", parse_category);
    check.severity = parse_or_throw<Severity>(c, "severity", parse_severity);
    check.issue_found = c.at("issue_found").get<bool>();
    report.checks.push_back(std::move(check));
  }

  const auto& summary = j.at("summary");
  report.summary.total_patterns = summary.at("total_patterns").get<std::size_t>();
  report.summary.issues_found = summary.at("issues_found").get<std::size_t>();
  report.summary.high_severity = summary.at("high_severity").get<std::size_t>();
  report.summary.medium_severity = summary.at("medium_severity").get<std::size_t>();
  report.summary.low_severity = summary.at("low_severity").get<std::size_t>();

  return report;
}

}  // namespace catalyst::domain
