#include "fitscore/config/grade_thresholds.h"
#include "fitscore/config/penalty_rules.h"
#include "fitscore/config/synonym_table.h"
#include "fitscore/config/threshold_table.h"
#include "fitscore/config/weight_config.h"
#include "fitscore/core/normalization.h"

#include <cmath>
#include <map>
#include <set>

namespace fitscore::config {

namespace {

using ValidationResult = core::Result<bool, std::string>;

bool in_unit_interval(const double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

}  // namespace

double WeightConfig::weight_of(const domain::Category category) const {
  switch (category) {
    case domain::Category::kRequired:
      return required;
    case domain::Category::kPreferred:
      return preferred;
    case domain::Category::kExperience:
      return experience;
    case domain::Category::kOverall:
      return overall;
    case domain::Category::kEducation:
      return education;
    case domain::Category::kCertification:
      return certification;
  }
  return 0.0;
}

double WeightConfig::sum() const {
  double total = 0.0;
  for (const auto category : domain::kAllCategories) {
    total += weight_of(category);
  }
  return total;
}

ValidationResult WeightConfig::validate() const {
  for (const auto category : domain::kAllCategories) {
    const double w = weight_of(category);
    if (!std::isfinite(w) || w < 0.0) {
      return ValidationResult::err("weight for " + domain::to_string(category) +
                                   " must be a non-negative number");
    }
  }

  const double total = sum();
  if (std::abs(total - 1.0) > kWeightSumTolerance) {
    return ValidationResult::err("weights must sum to 1.0 (got " + std::to_string(total) + ")");
  }

  return ValidationResult::ok(true);
}

ValidationResult ThresholdTable::validate() const {
  if (!in_unit_interval(global_default)) {
    return ValidationResult::err("global default threshold must be in [0, 1]");
  }

  for (const auto& [token, threshold] : token_thresholds) {
    if (token.empty()) {
      return ValidationResult::err("threshold table contains an empty token");
    }
    if (!in_unit_interval(threshold)) {
      return ValidationResult::err("threshold for token '" + token + "' must be in [0, 1]");
    }
  }

  std::set<std::string> group_names;
  std::map<std::string, std::string> owner;  // token -> group name
  for (const auto& group : groups) {
    if (group.name.empty()) {
      return ValidationResult::err("conflict group name must not be empty");
    }
    if (!group_names.insert(group.name).second) {
      return ValidationResult::err("duplicate conflict group '" + group.name + "'");
    }
    if (group.threshold.has_value() && !in_unit_interval(group.threshold.value())) {
      return ValidationResult::err("threshold for group '" + group.name + "' must be in [0, 1]");
    }
    for (const auto& token : group.tokens) {
      const std::string key = core::normalize_term(token);
      if (key.empty()) {
        return ValidationResult::err("conflict group '" + group.name + "' has an empty token");
      }
      const auto [it, inserted] = owner.emplace(key, group.name);
      if (!inserted && it->second != group.name) {
        return ValidationResult::err("token '" + key + "' belongs to both '" + it->second +
                                     "' and '" + group.name + "'");
      }
    }
  }

  return ValidationResult::ok(true);
}

double PenaltyRules::magnitude_of(const domain::PenaltyKind kind) const {
  const auto it = magnitudes.find(kind);
  return it == magnitudes.end() ? 0.0 : it->second;
}

ValidationResult PenaltyRules::validate() const {
  for (const auto& [kind, magnitude] : magnitudes) {
    if (!in_unit_interval(magnitude)) {
      return ValidationResult::err("penalty " + domain::to_string(kind) +
                                   " magnitude must be in [0, 1]");
    }
  }
  if (!in_unit_interval(experience_penalty_cap)) {
    return ValidationResult::err("experience_penalty_cap must be in [0, 1]");
  }
  return ValidationResult::ok(true);
}

ValidationResult GradeThresholds::validate() const {
  if (bands.empty()) {
    return ValidationResult::err("grade thresholds must define at least one band");
  }

  std::set<std::string> labels;
  for (std::size_t i = 0; i < bands.size(); ++i) {
    const auto& band = bands[i];
    if (band.label.empty()) {
      return ValidationResult::err("grade band label must not be empty");
    }
    if (!labels.insert(band.label).second) {
      return ValidationResult::err("duplicate grade band '" + band.label + "'");
    }
    if (!std::isfinite(band.min_percent)) {
      return ValidationResult::err("grade band '" + band.label + "' minimum is not a number");
    }
    if (i > 0 && band.min_percent >= bands[i - 1].min_percent) {
      return ValidationResult::err("grade bands must be strictly descending at '" + band.label +
                                   "'");
    }
  }

  if (bands.front().min_percent > 100.0) {
    return ValidationResult::err("top grade band minimum must be <= 100");
  }
  if (bands.back().min_percent != 0.0) {
    return ValidationResult::err("lowest grade band must start at 0 so every score is graded");
  }

  return ValidationResult::ok(true);
}

ValidationResult SynonymTable::validate() const {
  std::map<std::string, std::string> surface_owner;  // surface form -> canonical

  for (const auto& entry : entries) {
    const std::string canonical = core::normalize_term(entry.canonical);
    if (canonical.empty()) {
      return ValidationResult::err("synonym entry has an empty canonical form");
    }

    const auto claim = [&](const std::string& surface) -> ValidationResult {
      const auto [it, inserted] = surface_owner.emplace(surface, canonical);
      if (!inserted && it->second != canonical) {
        return ValidationResult::err("synonym '" + surface + "' maps to both '" + it->second +
                                     "' and '" + canonical + "'");
      }
      return ValidationResult::ok(true);
    };

    auto claimed = claim(canonical);
    if (!claimed.has_value()) {
      return claimed;
    }
    for (const auto& alias : entry.aliases) {
      const std::string surface = core::normalize_term(alias);
      if (surface.empty()) {
        return ValidationResult::err("synonym entry '" + canonical + "' has an empty alias");
      }
      claimed = claim(surface);
      if (!claimed.has_value()) {
        return claimed;
      }
    }
  }

  for (const auto& term : ambiguous_terms) {
    if (core::normalize_term(term).empty()) {
      return ValidationResult::err("ambiguous term list contains an empty entry");
    }
  }

  return ValidationResult::ok(true);
}

std::map<std::string, std::string> SynonymTable::surface_index() const {
  std::map<std::string, std::string> index;
  for (const auto& entry : entries) {
    const std::string canonical = core::normalize_term(entry.canonical);
    if (canonical.empty()) {
      continue;
    }
    index.emplace(canonical, canonical);
    for (const auto& alias : entry.aliases) {
      const std::string surface = core::normalize_term(alias);
      if (!surface.empty()) {
        index.emplace(surface, canonical);
      }
    }
  }
  return index;
}

}  // namespace fitscore::config
