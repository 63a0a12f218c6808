#include "catalyst/evaluation/rule_evaluator.h"

#include "catalyst/core/normalization.h"
#include "catalyst/evaluation/scoring.h"

#include <algorithm>
#include <atomic>
#include <thread>

namespace catalyst::evaluation {

namespace {

domain::Detection make_detection(const rules::Rule& rule) {
  domain::Detection detection;
  detection.rule_id = rule.id;
  detection.kind = rule.kind;
  detection.confidence = rule.confidence;
  detection.severity = rule.severity;
  detection.category = rule.category;
  detection.title = rule.title;
  return detection;
}

void check_file_absence(const domain::ProjectSnapshot& snapshot, const rules::Rule& rule,
                        domain::Detection& detection) {
  const auto it = std::find_if(rule.targets.begin(), rule.targets.end(),
                               [&snapshot](const std::string& t) { return snapshot.has_file(t); });
  detection.issue_found = it == rule.targets.end();
  if (!detection.issue_found) {
    detection.evidence.matched_candidate = *it;
  }
}

// A regular file at a candidate path also satisfies a directory check (e.g. a "tests"
// file that is really a script).
void check_directory_absence(const domain::ProjectSnapshot& snapshot, const rules::Rule& rule,
                             domain::Detection& detection) {
  for (const auto& target : rule.targets) {
    if (snapshot.has_directory(target)) {
      detection.evidence.matched_candidate = target;
      return;
    }
  }
  for (const auto& target : rule.targets) {
    if (snapshot.has_file(target)) {
      detection.evidence.matched_candidate = target;
      detection.evidence.notes.emplace_back("satisfied by a file at " + target);
      return;
    }
  }
  detection.issue_found = true;
}

void check_file_quality(const domain::ProjectSnapshot& snapshot, const rules::Rule& rule,
                        const IFileContentSource& content, domain::Detection& detection) {
  auto& evidence = detection.evidence;
  const auto it = std::find_if(rule.targets.begin(), rule.targets.end(),
                               [&snapshot](const std::string& t) { return snapshot.has_file(t); });
  if (it == rule.targets.end()) {
    detection.issue_found = true;
    evidence.notes.emplace_back("target absent");
    return;
  }
  evidence.matched_candidate = *it;

  const auto text = content.read(*it);
  if (!text.has_value()) {
    detection.issue_found = true;
    evidence.read_error = text.error();
    evidence.notes.emplace_back("target unreadable; treated as absent");
    return;
  }

  const rules::QualityCriteria criteria =
      rule.quality_criteria.value_or(rules::QualityCriteria{});
  const std::size_t lines = core::count_lines(text.value());
  evidence.line_count = lines;
  evidence.min_lines = criteria.min_lines;

  for (const auto& section : criteria.required_sections) {
    if (text.value().find(section) != std::string::npos) {
      evidence.matched_sections.push_back(section);
    } else {
      evidence.missing_sections.push_back(section);
    }
  }

  const bool too_short = criteria.min_lines.has_value() && lines < criteria.min_lines.value();
  detection.issue_found = too_short || !evidence.missing_sections.empty();

  // Near miss: every section is there and the file is within 80% of the minimum.
  if (too_short && evidence.missing_sections.empty() &&
      lines * 5 >= criteria.min_lines.value() * 4) {
    evidence.marginal_quality = true;
  }
}

}  // namespace

RuleEvaluator::RuleEvaluator(EvaluationOptions options) : options_(options) {}

std::optional<domain::Detection> RuleEvaluator::evaluate_rule(
    const domain::ProjectSnapshot& snapshot, const rules::Rule& rule,
    const IFileContentSource& content) const {
  if (rule.applies_when.has_value() && !rule.applies_when->evaluate(snapshot)) {
    return std::nullopt;
  }

  domain::Detection detection = make_detection(rule);
  switch (rule.kind) {
    case domain::RuleKind::kFileAbsence:
      check_file_absence(snapshot, rule, detection);
      break;
    case domain::RuleKind::kDirectoryAbsence:
      check_directory_absence(snapshot, rule, detection);
      break;
    case domain::RuleKind::kFileQuality:
      check_file_quality(snapshot, rule, content, detection);
      break;
  }

  detection.recommendation = resolve_recommendation(rule, snapshot);
  return detection;
}

domain::AnalysisReport RuleEvaluator::evaluate(const domain::ProjectSnapshot& snapshot,
                                               const std::vector<rules::Rule>& rules,
                                               const IFileContentSource& content,
                                               const std::string& rule_set_version) const {
  // One slot per rule; each worker writes only the slots it claims.
  std::vector<std::optional<domain::Detection>> results(rules.size());

  const std::size_t workers =
      std::min<std::size_t>(std::max<std::size_t>(options_.workers, 1), rules.size());
  if (workers <= 1) {
    for (std::size_t i = 0; i < rules.size(); ++i) {
      results[i] = evaluate_rule(snapshot, rules[i], content);
    }
  } else {
    std::atomic<std::size_t> next_index{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t worker = 0; worker < workers; ++worker) {
      pool.emplace_back([&]() {
        while (true) {
          const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
          if (index >= rules.size()) {
            break;
          }
          results[index] = evaluate_rule(snapshot, rules[index], content);
        }
      });
    }
    for (std::thread& thread : pool) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  domain::AnalysisReport report;
  report.project_name = snapshot.project_name();
  report.project_types = snapshot.project_types();
  report.frameworks = snapshot.frameworks();
  report.rule_set_version = rule_set_version;

  for (auto& result : results) {
    if (!result.has_value()) {
      continue;
    }
    ++report.summary.total_patterns;
    report.checks.push_back(
        {result->rule_id, result->category, result->severity, result->issue_found});

    if (!result->issue_found) {
      continue;
    }
    ++report.summary.issues_found;
    switch (result->severity) {
      case domain::Severity::kHigh:
        ++report.summary.high_severity;
        break;
      case domain::Severity::kMedium:
        ++report.summary.medium_severity;
        break;
      case domain::Severity::kLow:
        ++report.summary.low_severity;
        break;
    }
    report.detections.push_back(std::move(result.value()));
  }

  std::sort(report.detections.begin(), report.detections.end(), detection_order);
  std::sort(report.checks.begin(), report.checks.end(),
            [](const domain::CheckOutcome& a, const domain::CheckOutcome& b) {
              return a.rule_id < b.rule_id;
            });

  report.health_score =
      compute_health_score(report.summary.total_patterns, report.summary.issues_found,
                           report.summary.high_severity, report.summary.medium_severity);
  return report;
}

bool detection_order(const domain::Detection& a, const domain::Detection& b) {
  const double pa = a.priority_score();
  const double pb = b.priority_score();
  if (pa != pb) {
    return pa > pb;
  }
  return a.rule_id < b.rule_id;
}

std::optional<domain::ResolvedRecommendation> resolve_recommendation(
    const rules::Rule& rule, const domain::ProjectSnapshot& snapshot) {
  if (!rule.recommendation.has_value()) {
    return std::nullopt;
  }

  const auto& recommendation = rule.recommendation.value();
  domain::ResolvedRecommendation resolved{recommendation.template_id, recommendation.reason,
                                          false};
  for (const auto& variant : recommendation.variants) {
    if (variant.when.evaluate(snapshot)) {
      resolved.template_id = variant.template_id;
      resolved.variant_applied = true;
      break;
    }
  }
  return resolved;
}

}  // namespace catalyst::evaluation
