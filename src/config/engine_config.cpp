#include "fitscore/config/engine_config.h"

#include "fitscore/config/presets.h"
#include "fitscore/core/normalization.h"

#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

namespace fitscore::config {

namespace {

using json = nlohmann::json;
using ValidationResult = core::Result<bool, std::string>;

ValidationResult validate_params(const MatchingParams& params) {
  if (!std::isfinite(params.critical_weight) || params.critical_weight < 1.0) {
    return ValidationResult::err("params.critical_weight must be >= 1.0");
  }
  const auto unit = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };
  if (!unit(params.near_miss_margin)) {
    return ValidationResult::err("params.near_miss_margin must be in [0, 1]");
  }
  if (!unit(params.significant_shortfall_ratio)) {
    return ValidationResult::err("params.significant_shortfall_ratio must be in [0, 1]");
  }
  if (!unit(params.level_mismatch_reduction)) {
    return ValidationResult::err("params.level_mismatch_reduction must be in [0, 1]");
  }
  if (!unit(params.missing_ratio_trigger)) {
    return ValidationResult::err("params.missing_ratio_trigger must be in [0, 1]");
  }
  return ValidationResult::ok(true);
}

// Threshold keys and group tokens are applied under their canonical form, so two entries
// written under different surface forms of one skill must agree.
ValidationResult validate_threshold_vocabulary(const ThresholdTable& thresholds,
                                               const SynonymTable& synonyms) {
  const auto index = synonyms.surface_index();
  const auto canonical = [&](const std::string& token) {
    std::string key = core::normalize_term(token);
    const auto it = index.find(key);
    return it == index.end() ? key : it->second;
  };

  std::map<std::string, std::pair<std::string, double>> threshold_owner;
  for (const auto& [token, threshold] : thresholds.token_thresholds) {
    const auto [it, inserted] =
        threshold_owner.emplace(canonical(token), std::make_pair(token, threshold));
    if (!inserted && it->second.second != threshold) {
      return ValidationResult::err("thresholds for '" + it->second.first + "' and '" + token +
                                   "' disagree but both apply to '" + it->first + "'");
    }
  }

  std::map<std::string, std::string> group_owner;
  for (const auto& group : thresholds.groups) {
    for (const auto& token : group.tokens) {
      const auto [it, inserted] = group_owner.emplace(canonical(token), group.name);
      if (!inserted && it->second != group.name) {
        return ValidationResult::err("'" + it->first + "' belongs to both '" + it->second +
                                     "' and '" + group.name + "' through its synonyms");
      }
    }
  }

  return ValidationResult::ok(true);
}

WeightConfig weights_from_json(const json& j) {
  WeightConfig weights;
  weights.required = j.value("required", 0.0);
  weights.preferred = j.value("preferred", 0.0);
  weights.experience = j.value("experience", 0.0);
  weights.overall = j.value("overall", 0.0);
  weights.education = j.value("education", 0.0);
  weights.certification = j.value("certification", 0.0);
  return weights;
}

ThresholdTable thresholds_from_json(const json& j, ThresholdTable table) {
  table.global_default = j.value("default", table.global_default);
  if (j.contains("tokens")) {
    table.token_thresholds.clear();
    for (const auto& [token, threshold] : j.at("tokens").items()) {
      table.token_thresholds[core::normalize_term(token)] = threshold.get<double>();
    }
  }
  return table;
}

std::vector<ConflictGroup> groups_from_json(const json& j) {
  std::vector<ConflictGroup> groups;
  for (const auto& entry : j) {
    ConflictGroup group;
    group.name = entry.at("name").get<std::string>();
    for (const auto& token : entry.at("tokens")) {
      group.tokens.push_back(core::normalize_term(token.get<std::string>()));
    }
    if (entry.contains("threshold") && !entry.at("threshold").is_null()) {
      group.threshold = entry.at("threshold").get<double>();
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

// Unknown penalty names are reported rather than ignored: a typo would silently disable a rule.
core::Result<PenaltyRules, std::string> penalties_from_json(const json& j, PenaltyRules rules) {
  if (j.contains("magnitudes")) {
    rules.magnitudes.clear();
    for (const auto& [name, magnitude] : j.at("magnitudes").items()) {
      const auto kind = domain::parse_penalty_kind(name);
      if (!kind.has_value()) {
        return core::Result<PenaltyRules, std::string>::err("unknown penalty kind '" + name +
                                                            "'");
      }
      rules.magnitudes[kind.value()] = magnitude.get<double>();
    }
  }
  rules.experience_penalty_cap = j.value("experience_penalty_cap", rules.experience_penalty_cap);
  return core::Result<PenaltyRules, std::string>::ok(std::move(rules));
}

GradeThresholds grades_from_json(const json& j) {
  GradeThresholds grades;
  for (const auto& entry : j) {
    grades.bands.push_back(
        GradeBand{entry.at("label").get<std::string>(), entry.at("min_percent").get<double>()});
  }
  return grades;
}

SynonymTable synonyms_from_json(const json& j) {
  SynonymTable table;
  for (const auto& entry : j) {
    SynonymEntry synonym;
    synonym.canonical = core::normalize_term(entry.at("canonical").get<std::string>());
    if (entry.contains("aliases")) {
      for (const auto& alias : entry.at("aliases")) {
        synonym.aliases.push_back(core::normalize_term(alias.get<std::string>()));
      }
    }
    table.entries.push_back(std::move(synonym));
  }
  return table;
}

MatchingParams params_from_json(const json& j, MatchingParams params) {
  params.critical_weight = j.value("critical_weight", params.critical_weight);
  params.near_miss_margin = j.value("near_miss_margin", params.near_miss_margin);
  params.significant_shortfall_ratio =
      j.value("significant_shortfall_ratio", params.significant_shortfall_ratio);
  params.level_mismatch_reduction =
      j.value("level_mismatch_reduction", params.level_mismatch_reduction);
  params.missing_ratio_trigger = j.value("missing_ratio_trigger", params.missing_ratio_trigger);
  return params;
}

}  // namespace

core::Result<bool, std::string> validate_engine_config(const EngineConfig& config) {
  if (config.config_version.empty()) {
    return ValidationResult::err("config_version must not be empty");
  }
  if (!weights_for_policy(config.policy_version).has_value()) {
    return ValidationResult::err("unknown policy_version '" + config.policy_version + "'");
  }

  const ValidationResult checks[] = {
      config.weights.validate(),  config.thresholds.validate(), config.penalties.validate(),
      config.grades.validate(),   config.synonyms.validate(),   validate_params(config.params),
      validate_threshold_vocabulary(config.thresholds, config.synonyms),
  };
  for (const auto& check : checks) {
    if (!check.has_value()) {
      return check;
    }
  }

  return ValidationResult::ok(true);
}

ConfigResult load_engine_config_json(const json& doc) {
  try {
    if (!doc.is_object()) {
      return ConfigResult::err("configuration must be a JSON object");
    }

    const std::string policy = doc.value("policy_version", std::string{kSectionalV2Policy});
    if (!weights_for_policy(policy).has_value()) {
      return ConfigResult::err("unknown policy_version '" + policy + "'");
    }

    EngineConfig config = default_engine_config(policy);
    config.config_version = doc.value("config_version", config.config_version);

    if (doc.contains("weights")) {
      config.weights = weights_from_json(doc.at("weights"));
    }
    if (doc.contains("thresholds")) {
      config.thresholds = thresholds_from_json(doc.at("thresholds"), config.thresholds);
    }
    if (doc.contains("conflict_groups")) {
      config.thresholds.groups = groups_from_json(doc.at("conflict_groups"));
    }
    if (doc.contains("penalties")) {
      auto rules = penalties_from_json(doc.at("penalties"), config.penalties);
      if (!rules.has_value()) {
        return ConfigResult::err(rules.error());
      }
      config.penalties = rules.take_value();
    }
    if (doc.contains("grades")) {
      config.grades = grades_from_json(doc.at("grades"));
    }
    if (doc.contains("synonyms")) {
      config.synonyms.entries = synonyms_from_json(doc.at("synonyms")).entries;
    }
    if (doc.contains("ambiguous_terms")) {
      config.synonyms.ambiguous_terms.clear();
      for (const auto& term : doc.at("ambiguous_terms")) {
        config.synonyms.ambiguous_terms.push_back(core::normalize_term(term.get<std::string>()));
      }
    }
    if (doc.contains("params")) {
      config.params = params_from_json(doc.at("params"), config.params);
    }

    const auto valid = validate_engine_config(config);
    if (!valid.has_value()) {
      return ConfigResult::err("invalid configuration: " + valid.error());
    }

    return ConfigResult::ok(std::make_shared<const EngineConfig>(std::move(config)));
  } catch (const json::exception& e) {
    return ConfigResult::err(std::string("malformed configuration: ") + e.what());
  }
}

ConfigResult load_engine_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return ConfigResult::err("cannot open configuration file: " + path);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();

  json doc = json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded()) {
    return ConfigResult::err("configuration file is not valid JSON: " + path);
  }
  return load_engine_config_json(doc);
}

json config_to_json(const EngineConfig& config) {
  json weights;
  for (const auto category : domain::kAllCategories) {
    weights[domain::to_string(category)] = config.weights.weight_of(category);
  }

  json thresholds;
  thresholds["default"] = config.thresholds.global_default;
  thresholds["tokens"] = config.thresholds.token_thresholds;

  json groups = json::array();
  for (const auto& group : config.thresholds.groups) {
    json entry;
    entry["name"] = group.name;
    entry["tokens"] = group.tokens;
    if (group.threshold.has_value()) {
      entry["threshold"] = group.threshold.value();
    } else {
      entry["threshold"] = nullptr;
    }
    groups.push_back(std::move(entry));
  }

  json magnitudes = json::object();
  for (const auto& [kind, magnitude] : config.penalties.magnitudes) {
    magnitudes[domain::to_string(kind)] = magnitude;
  }
  json penalties;
  penalties["experience_penalty_cap"] = config.penalties.experience_penalty_cap;
  penalties["magnitudes"] = std::move(magnitudes);

  json grades = json::array();
  for (const auto& band : config.grades.bands) {
    grades.push_back(json{{"label", band.label}, {"min_percent", band.min_percent}});
  }

  json synonyms = json::array();
  for (const auto& entry : config.synonyms.entries) {
    synonyms.push_back(json{{"aliases", entry.aliases}, {"canonical", entry.canonical}});
  }

  json params;
  params["critical_weight"] = config.params.critical_weight;
  params["level_mismatch_reduction"] = config.params.level_mismatch_reduction;
  params["missing_ratio_trigger"] = config.params.missing_ratio_trigger;
  params["near_miss_margin"] = config.params.near_miss_margin;
  params["significant_shortfall_ratio"] = config.params.significant_shortfall_ratio;

  json j;
  j["ambiguous_terms"] = config.synonyms.ambiguous_terms;
  j["config_version"] = config.config_version;
  j["conflict_groups"] = std::move(groups);
  j["grades"] = std::move(grades);
  j["params"] = std::move(params);
  j["penalties"] = std::move(penalties);
  j["policy_version"] = config.policy_version;
  j["synonyms"] = std::move(synonyms);
  j["thresholds"] = std::move(thresholds);
  j["weights"] = std::move(weights);
  return j;
}

}  // namespace fitscore::config
