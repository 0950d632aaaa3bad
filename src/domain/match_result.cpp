#include "fitscore/domain/match_result.h"

#include "fitscore/core/clock.h"
#include "fitscore/core/version.h"

#include <algorithm>

namespace fitscore::domain {

namespace {

nlohmann::json optional_string(const std::optional<std::string>& value) {
  if (value.has_value()) {
    return value.value();
  }
  return nullptr;
}

nlohmann::json item_to_json(const ItemEvidence& item) {
  nlohmann::json j;
  j["basis"] = to_string(item.basis);
  j["best_similarity"] = item.best_similarity;
  j["conflict_group"] = optional_string(item.conflict_group);
  j["critical"] = item.critical;
  j["degraded"] = item.degraded;
  j["dominant_token"] = optional_string(item.dominant_token);
  j["item_id"] = item.item_id;
  j["kind"] = to_string(item.kind);
  j["matched"] = item.matched;
  j["matched_candidate_item"] = optional_string(item.matched_candidate_item);
  j["near_miss"] = item.near_miss;
  j["text"] = item.text;
  j["threshold"] = item.threshold;
  j["vetoed"] = item.vetoed;
  j["weight"] = item.weight;
  return j;
}

nlohmann::json section_to_json(const SectionOutcome& section) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : section.items) {
    items.push_back(item_to_json(item));
  }

  nlohmann::json j;
  j["candidate_empty"] = section.candidate_empty;
  j["degraded_items"] = section.degraded_items;
  j["items"] = std::move(items);
  j["match_rate"] = section.match_rate();
  j["matched_items"] = section.matched_items;
  j["matched_weight"] = section.matched_weight;
  j["missing_items"] = section.missing_items;
  j["missing_material"] = section.missing_material;
  j["requirement_empty"] = section.requirement_empty;
  j["score"] = section.score;
  j["section"] = section.section;
  j["total_weight"] = section.total_weight;
  return j;
}

nlohmann::json experience_to_json(const ExperienceEvidence& experience) {
  nlohmann::json j;
  j["candidate_level"] = to_string(experience.candidate_level);
  j["candidate_level_derived"] = experience.candidate_level_derived;
  j["candidate_years"] = experience.candidate_years;
  j["fit"] = experience.fit;
  j["level_mismatch"] = experience.level_mismatch;
  j["narrative_similarity"] = experience.narrative_similarity;
  if (experience.required_level.has_value()) {
    j["required_level"] = to_string(experience.required_level.value());
  } else {
    j["required_level"] = nullptr;
  }
  if (experience.required_max_years.has_value()) {
    j["required_max_years"] = experience.required_max_years.value();
  } else {
    j["required_max_years"] = nullptr;
  }
  j["required_min_years"] = experience.required_min_years;
  j["shortfall_ratio"] = experience.shortfall_ratio;
  j["significantly_lacking"] = experience.significantly_lacking;
  return j;
}

}  // namespace

std::string to_string(const MatchBasis basis) {
  switch (basis) {
    case MatchBasis::kNone:
      return "none";
    case MatchBasis::kLexical:
      return "lexical";
    case MatchBasis::kSemantic:
      return "semantic";
  }
  return "none";
}

std::string SectionOutcome::match_rate() const {
  return std::to_string(matched_items.size()) + "/" + std::to_string(items.size());
}

std::optional<double> MatchResult::category_score(const Category category) const {
  for (const auto& c : categories) {
    if (c.category == category) {
      return c.score;
    }
  }
  return std::nullopt;
}

std::optional<double> MatchResult::penalty(const PenaltyKind kind) const {
  for (const auto& p : penalties) {
    if (p.kind == kind) {
      return p.magnitude;
    }
  }
  return std::nullopt;
}

bool MatchResult::has_flag(const std::string& flag) const {
  return std::binary_search(flags.begin(), flags.end(), flag);
}

nlohmann::json match_result_to_json(const MatchResult& result) {
  using json = nlohmann::json;

  json categories = json::array();
  for (const auto& c : result.categories) {
    json entry;
    entry["category"] = to_string(c.category);
    entry["contribution"] = c.contribution();
    entry["percent"] = c.score * 100.0;
    entry["score"] = c.score;
    entry["weight"] = c.weight;
    categories.push_back(std::move(entry));
  }

  json penalties = json::object();
  json raw_penalties = json::object();
  for (const auto& p : result.penalties) {
    penalties[to_string(p.kind)] = p.magnitude;
    raw_penalties[to_string(p.kind)] = p.raw_magnitude;
  }

  // Top-level keys sort alphabetically (std::map-backed object).
  json j;
  j["calculated_at"] = result.calculated_at;
  j["calculated_at_iso"] = core::to_iso8601(result.calculated_at);
  j["candidate_id"] = result.candidate_id;
  j["categories"] = std::move(categories);
  j["config_version"] = result.config_version;
  j["experience"] = experience_to_json(result.experience);
  j["flags"] = result.flags;
  j["grade"] = result.grade;
  j["overall_percent"] = result.overall_percent;
  j["penalties"] = std::move(penalties);
  j["penalties_uncapped"] = std::move(raw_penalties);
  j["penalty_total"] = result.penalty_total;
  j["policy_version"] = result.policy_version;
  j["position_id"] = result.position_id;
  j["preferred"] = section_to_json(result.preferred);
  j["required"] = section_to_json(result.required);
  j["schema_version"] = core::kResultSchemaVersion;
  j["weighted_sum"] = result.weighted_sum;

  return j;
}

}  // namespace fitscore::domain
