#pragma once

#include "fitscore/config/engine_config.h"
#include "fitscore/config/weight_config.h"

#include <optional>
#include <string>
#include <string_view>

namespace fitscore::config {

inline constexpr std::string_view kSectionalV2Policy = "sectional_v2";
inline constexpr std::string_view kDynamicThresholdV3Policy = "dynamic_threshold_v3";

// Fixed sectional weights: required dominates, education and certification are tie-breakers.
inline WeightConfig sectional_v2_preset() {
  return WeightConfig{0.40, 0.08, 0.30, 0.20, 0.015, 0.005};
}

// Per-technology threshold revision: only the four core categories carry weight.
inline WeightConfig dynamic_threshold_v3_preset() {
  return WeightConfig{0.60, 0.20, 0.10, 0.10, 0.0, 0.0};
}

// weights_for_policy returns the preset weights of a policy, or nullopt if unknown.
[[nodiscard]] std::optional<WeightConfig> weights_for_policy(std::string_view policy_version);

[[nodiscard]] ThresholdTable default_threshold_table();
[[nodiscard]] PenaltyRules default_penalty_rules();
[[nodiscard]] GradeThresholds default_grade_thresholds();
[[nodiscard]] SynonymTable default_synonym_table();

// default_engine_config assembles the built-in tables under the given policy.
// An unknown policy falls back to sectional_v2.
[[nodiscard]] EngineConfig default_engine_config(
    std::string_view policy_version = kSectionalV2Policy);

}  // namespace fitscore::config
