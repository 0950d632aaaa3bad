#include "fitscore/config/presets.h"

namespace fitscore::config {

std::optional<WeightConfig> weights_for_policy(const std::string_view policy_version) {
  if (policy_version == kSectionalV2Policy) {
    return sectional_v2_preset();
  }
  if (policy_version == kDynamicThresholdV3Policy) {
    return dynamic_threshold_v3_preset();
  }
  return std::nullopt;
}

ThresholdTable default_threshold_table() {
  ThresholdTable table;
  table.global_default = 0.6;

  // Short, ambiguous names need stronger evidence before a semantic match counts.
  table.token_thresholds = {
      {"c", 0.8},          {"c++", 0.75},     {"go", 0.78},     {"r", 0.8},
      {"java", 0.72},      {"javascript", 0.7}, {"kubernetes", 0.68}, {"sql", 0.65},
  };

  table.groups = {
      ConflictGroup{"jvm_backend", {"java", "kotlin", "scala", "spring boot"}, 0.7},
      ConflictGroup{"python_backend", {"python", "django", "flask", "fastapi"}, 0.7},
      ConflictGroup{"node_backend", {"node.js", "express", "nestjs"}, 0.7},
      ConflictGroup{"dotnet_backend", {"c#", "asp.net"}, 0.7},
      ConflictGroup{"ruby_backend", {"ruby", "ruby on rails"}, 0.7},
      ConflictGroup{"php_backend", {"php", "laravel"}, 0.7},
      ConflictGroup{"react_ecosystem", {"react", "next.js"}, 0.68},
      ConflictGroup{"vue_ecosystem", {"vue", "nuxt"}, 0.68},
      ConflictGroup{"angular_ecosystem", {"angular"}, 0.68},
  };

  return table;
}

PenaltyRules default_penalty_rules() {
  PenaltyRules rules;
  rules.magnitudes = {
      {domain::PenaltyKind::kExperienceLevelMismatch, 0.25},
      {domain::PenaltyKind::kExperienceSignificantlyLacking, 0.20},
      {domain::PenaltyKind::kDomainMismatch, 0.20},
      {domain::PenaltyKind::kRoleMismatch, 0.15},
      {domain::PenaltyKind::kRequiredSkillMissing, 0.15},
      {domain::PenaltyKind::kRequiredSkillCriticalMissing, 0.25},
  };
  rules.experience_penalty_cap = 0.15;
  return rules;
}

GradeThresholds default_grade_thresholds() {
  return GradeThresholds{{
      {"excellent", 85.0},
      {"good", 70.0},
      {"fair", 55.0},
      {"caution", 40.0},
      {"poor", 0.0},
  }};
}

SynonymTable default_synonym_table() {
  SynonymTable table;
  table.entries = {
      {"javascript", {"js", "ecmascript"}},
      {"typescript", {"ts"}},
      {"node.js", {"node", "nodejs"}},
      {"react", {"react.js", "reactjs"}},
      {"vue", {"vue.js", "vuejs"}},
      {"angular", {"angularjs"}},
      {"next.js", {"nextjs"}},
      {"nuxt", {"nuxt.js", "nuxtjs"}},
      {"nestjs", {"nest.js"}},
      {"express", {"express.js", "expressjs"}},
      {"kubernetes", {"k8s"}},
      {"postgresql", {"postgres", "psql"}},
      {"mysql", {}},
      {"mongodb", {"mongo"}},
      {"spring boot", {"springboot", "spring"}},
      {"java", {}},
      {"kotlin", {}},
      {"scala", {}},
      {"python", {"py", "python3"}},
      {"django", {}},
      {"flask", {}},
      {"fastapi", {}},
      {"c++", {"cpp", "cplusplus"}},
      {"c#", {"csharp"}},
      {"asp.net", {"aspnet", "asp.net core", ".net"}},
      {"go", {"golang"}},
      {"ruby", {}},
      {"ruby on rails", {"rails", "ror"}},
      {"php", {}},
      {"laravel", {}},
      {"amazon web services", {"aws"}},
      {"google cloud platform", {"gcp"}},
      {"machine learning", {"ml"}},
      {"continuous integration", {"ci/cd", "ci"}},
      {"docker", {}},
      {"sql", {}},
  };

  // Ordinary words or single letters in prose; "golang" and "spring boot" are still detected.
  table.ambiguous_terms = {"c", "go", "r", "spring"};
  return table;
}

EngineConfig default_engine_config(const std::string_view policy_version) {
  EngineConfig config;
  const auto weights = weights_for_policy(policy_version);
  config.policy_version = weights.has_value() ? std::string{policy_version}
                                              : std::string{kSectionalV2Policy};
  config.config_version = "builtin-" + config.policy_version;
  config.weights = weights.has_value() ? weights.value() : sectional_v2_preset();
  config.thresholds = default_threshold_table();
  config.penalties = default_penalty_rules();
  config.grades = default_grade_thresholds();
  config.synonyms = default_synonym_table();
  config.params = MatchingParams{};
  return config;
}

}  // namespace fitscore::config
