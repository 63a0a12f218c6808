#include "catalyst/rules/rule_loader.h"

#include "catalyst/core/file_io.h"
#include "catalyst/core/normalization.h"

#include <set>

namespace catalyst::rules {

namespace {

using LoadResult = core::Result<RuleLoadResult, std::string>;
using EntryResult = core::Result<Rule, std::string>;

// Returns the value of the first key present, or nullptr.
const nlohmann::json* find_either(const nlohmann::json& entry, const char* key,
                                  const char* alias) {
  if (entry.contains(key)) {
    return &entry.at(key);
  }
  if (alias != nullptr && entry.contains(alias)) {
    return &entry.at(alias);
  }
  return nullptr;
}

bool is_non_empty_string(const nlohmann::json& value) {
  return value.is_string() && !value.get<std::string>().empty();
}

core::Result<std::vector<std::string>, std::string> parse_targets(const nlohmann::json& value) {
  using TargetResult = core::Result<std::vector<std::string>, std::string>;

  std::vector<std::string> targets;
  if (is_non_empty_string(value)) {
    targets.push_back(value.get<std::string>());
    return TargetResult::ok(std::move(targets));
  }
  if (!value.is_array() || value.empty()) {
    return TargetResult::err("'target' must be a path or a non-empty array of paths");
  }
  for (const auto& item : value) {
    if (!is_non_empty_string(item)) {
      return TargetResult::err("'target' array entries must be non-empty strings");
    }
    targets.push_back(item.get<std::string>());
  }
  return TargetResult::ok(std::move(targets));
}

core::Result<QualityCriteria, std::string> parse_quality_criteria(const nlohmann::json& value) {
  using CriteriaResult = core::Result<QualityCriteria, std::string>;

  if (!value.is_object()) {
    return CriteriaResult::err("'quality_criteria' must be an object");
  }

  QualityCriteria criteria;
  if (value.contains("min_lines")) {
    const auto& min_lines = value.at("min_lines");
    if (!min_lines.is_number_integer() || min_lines.get<long long>() < 0) {
      return CriteriaResult::err("'min_lines' must be a non-negative integer");
    }
    criteria.min_lines = min_lines.get<std::size_t>();
  }
  if (value.contains("required_sections")) {
    const auto& sections = value.at("required_sections");
    if (!sections.is_array()) {
      return CriteriaResult::err("'required_sections' must be an array of strings");
    }
    for (const auto& section : sections) {
      if (!is_non_empty_string(section)) {
        return CriteriaResult::err("'required_sections' entries must be non-empty strings");
      }
      criteria.required_sections.push_back(section.get<std::string>());
    }
  }

  if (!criteria.min_lines.has_value() && criteria.required_sections.empty()) {
    return CriteriaResult::err("'quality_criteria' needs 'min_lines' or 'required_sections'");
  }
  return CriteriaResult::ok(std::move(criteria));
}

core::Result<Recommendation, std::string> parse_recommendation(const nlohmann::json& value) {
  using RecommendationResult = core::Result<Recommendation, std::string>;

  if (!value.is_object()) {
    return RecommendationResult::err("'recommendation' must be an object");
  }

  Recommendation recommendation;
  const auto* template_id = find_either(value, "template", "template_id");
  if (template_id == nullptr || !is_non_empty_string(*template_id)) {
    return RecommendationResult::err("'recommendation.template' must be a non-empty string");
  }
  recommendation.template_id = template_id->get<std::string>();

  if (value.contains("reason")) {
    if (!value.at("reason").is_string()) {
      return RecommendationResult::err("'recommendation.reason' must be a string");
    }
    recommendation.reason = value.at("reason").get<std::string>();
  }

  if (value.contains("variants")) {
    const auto& variants = value.at("variants");
    if (!variants.is_array()) {
      return RecommendationResult::err("'recommendation.variants' must be an array");
    }
    for (const auto& variant_json : variants) {
      if (!variant_json.is_object() || !variant_json.contains("when")) {
        return RecommendationResult::err("each variant needs a 'when' condition");
      }
      const auto* variant_template = find_either(variant_json, "template", "template_id");
      if (variant_template == nullptr || !is_non_empty_string(*variant_template)) {
        return RecommendationResult::err("each variant needs a non-empty 'template'");
      }
      auto when = parse_predicate(variant_json.at("when"));
      if (!when.has_value()) {
        return RecommendationResult::err("variant condition: " + when.error());
      }
      recommendation.variants.push_back(
          RecommendationVariant{when.value(), variant_template->get<std::string>()});
    }
  }

  return RecommendationResult::ok(std::move(recommendation));
}

// Validates one entry. The id has already been checked by the caller.
EntryResult parse_rule(const nlohmann::json& entry, std::string id) {
  Rule rule;
  rule.id = std::move(id);

  const auto* kind_json = find_either(entry, "kind", "type");
  if (kind_json == nullptr || !kind_json->is_string()) {
    return EntryResult::err("missing 'kind'");
  }
  const auto kind = domain::parse_rule_kind(kind_json->get<std::string>());
  if (!kind.has_value()) {
    return EntryResult::err("unknown kind '" + kind_json->get<std::string>() + "'");
  }
  rule.kind = kind.value();

  const auto* target_json = find_either(entry, "target", "check");
  if (target_json == nullptr) {
    return EntryResult::err("missing 'target'");
  }
  auto targets = parse_targets(*target_json);
  if (!targets.has_value()) {
    return EntryResult::err(targets.error());
  }
  rule.targets = targets.value();

  if (entry.contains("confidence")) {
    const auto& value = entry.at("confidence");
    const auto confidence =
        value.is_string() ? domain::parse_confidence(value.get<std::string>()) : std::nullopt;
    if (!confidence.has_value()) {
      return EntryResult::err("'confidence' must be one of high, medium, low");
    }
    rule.confidence = confidence.value();
  }

  if (entry.contains("severity")) {
    const auto& value = entry.at("severity");
    const auto severity =
        value.is_string() ? domain::parse_severity(value.get<std::string>()) : std::nullopt;
    if (!severity.has_value()) {
      return EntryResult::err("'severity' must be one of high, medium, low");
    }
    rule.severity = severity.value();
  }

  if (entry.contains("category")) {
    const auto& value = entry.at("category");
    const auto category =
        value.is_string() ? domain::parse_category(value.get<std::string>()) : std::nullopt;
    if (!category.has_value()) {
      return EntryResult::err("unknown 'category'");
    }
    rule.category = category.value();
  } else {
    rule.category = domain::infer_category(rule.id);
  }

  if (entry.contains("title") && is_non_empty_string(entry.at("title"))) {
    rule.title = entry.at("title").get<std::string>();
  } else {
    rule.title = core::title_from_id(rule.id);
  }

  if (rule.kind == domain::RuleKind::kFileQuality) {
    const auto* criteria_json = find_either(entry, "quality_criteria", "criteria");
    if (criteria_json == nullptr) {
      return EntryResult::err("file_quality rules require 'quality_criteria'");
    }
    auto criteria = parse_quality_criteria(*criteria_json);
    if (!criteria.has_value()) {
      return EntryResult::err(criteria.error());
    }
    rule.quality_criteria = criteria.value();
  }

  if (entry.contains("applies_when")) {
    auto predicate = parse_predicate(entry.at("applies_when"));
    if (!predicate.has_value()) {
      return EntryResult::err("'applies_when': " + predicate.error());
    }
    rule.applies_when = predicate.value();
  }

  if (entry.contains("recommendation")) {
    auto recommendation = parse_recommendation(entry.at("recommendation"));
    if (!recommendation.has_value()) {
      return EntryResult::err(recommendation.error());
    }
    rule.recommendation = recommendation.value();
  }

  return EntryResult::ok(std::move(rule));
}

}  // namespace

LoadResult load_rules_json(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    return LoadResult::err("Rule source must be a JSON object");
  }
  if (!doc.contains("rules") || !doc.at("rules").is_array()) {
    return LoadResult::err("Rule source has no 'rules' array");
  }

  RuleLoadResult result;
  if (doc.contains("version") && doc.at("version").is_string()) {
    result.version = doc.at("version").get<std::string>();
  }

  std::set<std::string> seen_ids;
  const auto& entries = doc.at("rules");
  for (std::size_t index = 0; index < entries.size(); ++index) {
    const auto& entry = entries.at(index);

    if (!entry.is_object()) {
      result.warnings.push_back({index, std::nullopt, "rule entry must be an object"});
      continue;
    }
    if (!entry.contains("id") || !is_non_empty_string(entry.at("id"))) {
      result.warnings.push_back({index, std::nullopt, "missing or empty 'id'"});
      continue;
    }

    // The first entry carrying an id claims it, even if that entry is then rejected.
    std::string id = entry.at("id").get<std::string>();
    if (!seen_ids.insert(id).second) {
      result.warnings.push_back({index, id, "duplicate id; first occurrence kept"});
      continue;
    }

    auto rule = parse_rule(entry, id);
    if (!rule.has_value()) {
      result.warnings.push_back({index, id, rule.error()});
      continue;
    }

    result.rules.push_back(rule.value());
  }

  return LoadResult::ok(std::move(result));
}

LoadResult load_rules(std::string_view source) {
  const auto doc = nlohmann::json::parse(source.begin(), source.end(), nullptr, false);
  if (doc.is_discarded()) {
    return LoadResult::err("Rule source is not valid JSON");
  }
  return load_rules_json(doc);
}

LoadResult load_rules_file(const std::string& path) {
  auto content = core::read_text_file(path);
  if (!content.has_value()) {
    return LoadResult::err(content.error());
  }

  auto result = load_rules(content.value());
  if (!result.has_value()) {
    return LoadResult::err(path + ": " + result.error());
  }
  return result;
}

std::string describe_warning(const LoadWarning& warning) {
  std::string text = "rules[" + std::to_string(warning.index) + "]";
  if (warning.rule_id.has_value()) {
    text += " (" + warning.rule_id.value() + ")";
  }
  return text + ": " + warning.message;
}

}  // namespace catalyst::rules
