#pragma once

#include "fitscore/config/grade_thresholds.h"
#include "fitscore/config/penalty_rules.h"
#include "fitscore/config/synonym_table.h"
#include "fitscore/config/threshold_table.h"
#include "fitscore/config/weight_config.h"
#include "fitscore/core/result.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace fitscore::config {

// MatchingParams are the tunable constants of the matchers and the penalty triggers.
struct MatchingParams {
  double critical_weight{2.0};               // weight of a critical required item (ordinary = 1)
  double near_miss_margin{0.05};             // NOLINT(readability-identifier-naming)
  double significant_shortfall_ratio{0.3};   // shortfall / min above this -> significantly_lacking
  double level_mismatch_reduction{0.15};     // subtracted from experience fit on level_mismatch
  double missing_ratio_trigger{0.5};         // missing / total required above this -> penalty
};

// EngineConfig is the complete, versioned, read-only configuration of one evaluation.
// Shared as std::shared_ptr<const EngineConfig>; never edited after validation.
//
// policy_version names the weight scheme ("sectional_v2" or "dynamic_threshold_v3").
// config_version identifies this particular table set in results and snapshots.
struct EngineConfig {
  std::string config_version{"builtin"};        // NOLINT(readability-identifier-naming)
  std::string policy_version{"sectional_v2"};  // NOLINT(readability-identifier-naming)
  WeightConfig weights;                         // NOLINT(readability-identifier-naming)
  ThresholdTable thresholds;                    // NOLINT(readability-identifier-naming)
  PenaltyRules penalties;                       // NOLINT(readability-identifier-naming)
  GradeThresholds grades;                       // NOLINT(readability-identifier-naming)
  SynonymTable synonyms;                        // NOLINT(readability-identifier-naming)
  MatchingParams params;                        // NOLINT(readability-identifier-naming)
};

// validate_engine_config checks every table invariant and the matching parameters.
// Returns ok(true) if valid, err(message) naming the first violation.
[[nodiscard]] core::Result<bool, std::string> validate_engine_config(const EngineConfig& config);

using ConfigResult = core::Result<std::shared_ptr<const EngineConfig>, std::string>;

// load_engine_config_json builds a configuration from a JSON document.
// The document selects a preset through "policy_version" (default "sectional_v2"); any of
// "weights", "thresholds", "conflict_groups", "penalties", "grades", "synonyms",
// "ambiguous_terms" and "params" present in the document replace the preset's table of that
// name. Token keys are normalized.
// The result is validated; parse and validation failures are returned as err(message).
[[nodiscard]] ConfigResult load_engine_config_json(const nlohmann::json& doc);

// load_engine_config_file reads and parses `path`, then defers to load_engine_config_json.
[[nodiscard]] ConfigResult load_engine_config_file(const std::string& path);

// config_to_json serializes a configuration in the shape load_engine_config_json accepts.
// Keys are sorted alphabetically, so equal configurations serialize identically.
[[nodiscard]] nlohmann::json config_to_json(const EngineConfig& config);

}  // namespace fitscore::config
