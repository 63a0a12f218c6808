#include "catalyst/reporting/report_formatter.h"

#include "catalyst/evaluation/scoring.h"

#include <algorithm>
#include <array>
#include <map>
#include <sstream>
#include <vector>

namespace catalyst::reporting {

namespace {

constexpr std::array<domain::Category, 7> kCategoryOrder = {
    domain::Category::kGit,         domain::Category::kDocumentation, domain::Category::kCiCd,
    domain::Category::kCodeQuality, domain::Category::kSetup,         domain::Category::kSecurity,
    domain::Category::kOther,
};

const char* severity_marker(const domain::Severity severity) {
  switch (severity) {
    case domain::Severity::kHigh:
      return "[!!]";
    case domain::Severity::kMedium:
      return "[! ]";
    case domain::Severity::kLow:
      return "[i ]";
  }
  return "[i ]";
}

template <typename Range, typename Fn>
std::string join(const Range& items, Fn to_text) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += ", ";
    }
    out += to_text(item);
  }
  return out;
}

std::string capitalize(std::string text) {
  if (!text.empty() && text.front() >= 'a' && text.front() <= 'z') {
    text.front() = static_cast<char>(text.front() - ('a' - 'A'));
  }
  return text;
}

void write_project_info(std::ostringstream& out, const domain::AnalysisReport& report) {
  out << "Project: " << report.project_name << "\n";
  const std::string types = join(report.project_types, [](const domain::ProjectType type) {
    return capitalize(domain::to_string(type));
  });
  out << "Type: " << (types.empty() ? "Unknown" : types) << "\n";
  if (!report.frameworks.empty()) {
    out << "Frameworks: "
        << join(report.frameworks, [](const std::string& f) { return capitalize(f); }) << "\n";
  }
  if (!report.rule_set_version.empty()) {
    out << "Rule Set: v" << report.rule_set_version << "\n";
  }
  out << "Patterns Checked: " << report.summary.total_patterns << "\n";
  out << "Issues Found: " << report.summary.issues_found << "\n";
}

void write_detection_line(std::ostringstream& out, const domain::Detection& detection) {
  out << "  " << severity_marker(detection.severity) << " " << detection.title
      << " (confidence: " << domain::to_string(detection.confidence)
      << ", severity: " << domain::to_string(detection.severity) << ")\n";

  const auto& evidence = detection.evidence;
  if (evidence.read_error.has_value()) {
    out << "       Could not read " << evidence.matched_candidate.value_or("target") << ": "
        << evidence.read_error.value() << "\n";
  } else if (evidence.line_count.has_value()) {
    out << "       " << evidence.matched_candidate.value_or("target") << ": "
        << evidence.line_count.value() << " lines";
    if (evidence.min_lines.has_value()) {
      out << " (minimum " << evidence.min_lines.value() << ")";
    }
    out << "\n";
    if (!evidence.missing_sections.empty()) {
      out << "       Missing sections: "
          << join(evidence.missing_sections, [](const std::string& s) { return s; }) << "\n";
    }
  }

  if (detection.recommendation.has_value()) {
    out << "       -> apply template " << detection.recommendation->template_id << "\n";
    if (!detection.recommendation->reason.empty()) {
      out << "       Reason: " << detection.recommendation->reason << "\n";
    }
  }
}

void write_category_status(std::ostringstream& out, const domain::AnalysisReport& report,
                           const FormatOptions& options) {
  // Category -> (any check evaluated, worst open severity).
  struct CategoryState {
    bool evaluated{false};
    bool has_issue{false};
    bool has_high{false};
  };
  std::map<domain::Category, CategoryState> states;
  for (const auto& check : report.checks) {
    auto& state = states[check.category];
    state.evaluated = true;
    if (check.issue_found) {
      state.has_issue = true;
      state.has_high = state.has_high || check.severity == domain::Severity::kHigh;
    }
  }

  for (const auto category : kCategoryOrder) {
    const auto it = states.find(category);
    if (it == states.end() || !it->second.evaluated) {
      continue;
    }
    const auto& state = it->second;
    if (!state.has_issue && !options.show_passing) {
      continue;
    }

    const char* status = !state.has_issue ? "OK" : (state.has_high ? "FAIL" : "WARN");
    out << domain::category_label(category) << ": " << status << "\n";

    for (const auto& detection : report.detections) {
      if (detection.category == category) {
        write_detection_line(out, detection);
      }
    }
  }
}

void write_priority_actions(std::ostringstream& out, const domain::AnalysisReport& report) {
  if (report.detections.empty()) {
    out << "No priority actions needed!\n";
    return;
  }

  out << "Priority Actions:\n";
  const std::size_t count = std::min(kTopPriorityCount, report.detections.size());
  for (std::size_t i = 0; i < count; ++i) {
    const auto& detection = report.detections[i];
    out << "  " << (i + 1) << ". " << detection.title << " ("
        << domain::to_string(detection.severity) << " severity)\n";
    if (detection.recommendation.has_value()) {
      out << "     -> apply template " << detection.recommendation->template_id << "\n";
    }
  }
}

void write_trend(std::ostringstream& out, const history::TrendSummary& trend) {
  out << "Trend since " << trend.previous_timestamp << ": " << trend.previous_score << " -> "
      << trend.current_score << " (" << (trend.score_delta >= 0 ? "+" : "") << trend.score_delta
      << ")\n";
  if (!trend.resolved_rule_ids.empty()) {
    out << "  Resolved: " << join(trend.resolved_rule_ids, [](const std::string& s) { return s; })
        << "\n";
  }
  if (!trend.new_rule_ids.empty()) {
    out << "  New: " << join(trend.new_rule_ids, [](const std::string& s) { return s; }) << "\n";
  }
}

}  // namespace

std::string format_text(const domain::AnalysisReport& report, const FormatOptions& options) {
  std::ostringstream out;
  out << "Project Analysis Results\n\n";
  write_project_info(out, report);
  out << "\n";

  if (!report.checks.empty()) {
    write_category_status(out, report, options);
    out << "\n";
  }

  write_priority_actions(out, report);
  out << "\n";

  if (options.trend.has_value()) {
    write_trend(out, options.trend.value());
    out << "\n";
  }

  const auto tier = evaluation::classify_health(report.health_score);
  out << "Project Health: " << report.health_score << "/100 (" << evaluation::tier_label(tier)
      << ")\n";
  return out.str();
}

nlohmann::json format_json(const domain::AnalysisReport& report, const FormatOptions& options) {
  nlohmann::json j = domain::report_to_json(report);
  j["health_tier"] = evaluation::tier_label(evaluation::classify_health(report.health_score));
  if (options.trend.has_value()) {
    j["trend"] = trend_to_json(options.trend.value());
  }
  return j;
}

std::string format_quiet(const domain::AnalysisReport& report) {
  return std::to_string(report.health_score);
}

nlohmann::json trend_to_json(const history::TrendSummary& trend) {
  return {{"current_score", trend.current_score},
          {"new_rule_ids", trend.new_rule_ids},
          {"previous_score", trend.previous_score},
          {"previous_timestamp", trend.previous_timestamp},
          {"resolved_rule_ids", trend.resolved_rule_ids},
          {"score_delta", trend.score_delta}};
}

}  // namespace catalyst::reporting
