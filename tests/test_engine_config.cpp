#include "fitscore/config/engine_config.h"
#include "fitscore/config/presets.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace fitscore;

TEST_CASE("Built-in presets are valid", "[config][presets]") {
  SECTION("sectional_v2") {
    const auto cfg = config::default_engine_config(config::kSectionalV2Policy);
    REQUIRE(config::validate_engine_config(cfg).has_value());
    REQUIRE(cfg.policy_version == "sectional_v2");
    REQUIRE(cfg.config_version == "builtin-sectional_v2");
    CHECK_THAT(cfg.weights.sum(), Catch::Matchers::WithinAbs(1.0, config::kWeightSumTolerance));
    REQUIRE(cfg.weights.required == 0.40);
  }

  SECTION("dynamic_threshold_v3") {
    const auto cfg = config::default_engine_config(config::kDynamicThresholdV3Policy);
    REQUIRE(config::validate_engine_config(cfg).has_value());
    REQUIRE(cfg.weights.required == 0.60);
    REQUIRE(cfg.weights.education == 0.0);
  }

  SECTION("unknown policy falls back to sectional_v2") {
    const auto cfg = config::default_engine_config("legacy_v1");
    REQUIRE(cfg.policy_version == "sectional_v2");
    REQUIRE_FALSE(config::weights_for_policy("legacy_v1").has_value());
  }
}

TEST_CASE("Table validation rejects broken invariants", "[config][validation]") {
  auto cfg = config::default_engine_config();

  SECTION("weights not summing to one") {
    cfg.weights.required += 0.1;
    auto result = config::validate_engine_config(cfg);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("sum to 1.0") != std::string::npos);
  }

  SECTION("negative weight") {
    cfg.weights = config::WeightConfig{1.1, -0.1, 0.0, 0.0, 0.0, 0.0};
    REQUIRE_FALSE(config::validate_engine_config(cfg).has_value());
  }

  SECTION("threshold outside [0, 1]") {
    cfg.thresholds.token_thresholds["rust"] = 1.2;
    REQUIRE_FALSE(config::validate_engine_config(cfg).has_value());
  }

  SECTION("token in two conflict groups") {
    cfg.thresholds.groups.push_back(config::ConflictGroup{"also_jvm", {"Java"}, 0.7});
    auto result = config::validate_engine_config(cfg);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("'java'") != std::string::npos);
  }

  SECTION("grade bands with a gap at the bottom") {
    cfg.grades.bands = {{"good", 70.0}, {"fair", 40.0}};
    REQUIRE_FALSE(config::validate_engine_config(cfg).has_value());
  }

  SECTION("grade bands not descending") {
    cfg.grades.bands = {{"fair", 40.0}, {"good", 70.0}, {"poor", 0.0}};
    REQUIRE_FALSE(config::validate_engine_config(cfg).has_value());
  }

  SECTION("alias claimed by two canonicals") {
    cfg.synonyms.entries.push_back(config::SynonymEntry{"jscript", {"JS"}});
    auto result = config::validate_engine_config(cfg);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("'js'") != std::string::npos);
  }

  SECTION("alias and canonical thresholds disagree") {
    cfg.thresholds.token_thresholds["k8s"] = 0.9;
    auto result = config::validate_engine_config(cfg);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("'kubernetes'") != std::string::npos);
  }

  SECTION("alias and canonical placed in different groups") {
    cfg.thresholds.groups.push_back(config::ConflictGroup{"systems", {"go"}, 0.7});
    cfg.thresholds.groups.push_back(config::ConflictGroup{"cloud_native", {"golang"}, 0.7});
    auto result = config::validate_engine_config(cfg);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("'go'") != std::string::npos);
  }

  SECTION("penalty cap outside [0, 1]") {
    cfg.penalties.experience_penalty_cap = 1.5;
    REQUIRE_FALSE(config::validate_engine_config(cfg).has_value());
  }

  SECTION("critical weight below one") {
    cfg.params.critical_weight = 0.5;
    REQUIRE_FALSE(config::validate_engine_config(cfg).has_value());
  }

  SECTION("empty config version") {
    cfg.config_version.clear();
    REQUIRE_FALSE(config::validate_engine_config(cfg).has_value());
  }
}

TEST_CASE("load_engine_config_json overlays the policy preset", "[config][load]") {
  SECTION("policy selects the preset weights") {
    const nlohmann::json doc = {{"policy_version", "dynamic_threshold_v3"},
                                {"config_version", "test-1"}};
    auto result = config::load_engine_config_json(doc);
    REQUIRE(result.has_value());
    const auto& cfg = *result.value();
    REQUIRE(cfg.config_version == "test-1");
    REQUIRE(cfg.weights.required == 0.60);
    REQUIRE(cfg.thresholds.token_thresholds.at("java") == 0.72);
  }

  SECTION("tables present in the document replace the preset") {
    const nlohmann::json doc = {
        {"thresholds", {{"default", 0.5}, {"tokens", {{"Rust", 0.9}}}}},
        {"penalties", {{"magnitudes", {{"domain_mismatch", 0.1}}}}},
        {"params", {{"critical_weight", 3.0}}},
    };
    auto result = config::load_engine_config_json(doc);
    REQUIRE(result.has_value());
    const auto& cfg = *result.value();
    REQUIRE(cfg.thresholds.global_default == 0.5);
    REQUIRE(cfg.thresholds.token_thresholds.size() == 1);
    REQUIRE(cfg.thresholds.token_thresholds.at("rust") == 0.9);
    REQUIRE(cfg.penalties.magnitudes.size() == 1);
    REQUIRE(cfg.penalties.experience_penalty_cap == 0.15);
    REQUIRE(cfg.params.critical_weight == 3.0);
    REQUIRE(cfg.params.near_miss_margin == 0.05);
  }

  SECTION("ambiguous terms are replaced as a list") {
    auto result = config::load_engine_config_json({{"ambiguous_terms", nlohmann::json::array({"Go", "swift"})}});
    REQUIRE(result.has_value());
    REQUIRE(result.value()->synonyms.ambiguous_terms == std::vector<std::string>{"go", "swift"});
    REQUIRE_FALSE(result.value()->synonyms.entries.empty());
  }

  SECTION("unknown policy is an error") {
    auto result = config::load_engine_config_json({{"policy_version", "legacy_v1"}});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("legacy_v1") != std::string::npos);
  }

  SECTION("unknown penalty kind is an error") {
    auto result = config::load_engine_config_json(
        {{"penalties", {{"magnitudes", {{"late_submission", 0.1}}}}}});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("late_submission") != std::string::npos);
  }

  SECTION("wrong JSON types are reported, not thrown") {
    auto result = config::load_engine_config_json({{"weights", "heavy"}});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("malformed configuration") != std::string::npos);
  }

  SECTION("invalid overlay fails validation") {
    auto result = config::load_engine_config_json(
        {{"weights", {{"required", 0.5}, {"preferred", 0.1}}}});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().find("invalid configuration") != std::string::npos);
  }

  SECTION("non-object document") {
    REQUIRE_FALSE(config::load_engine_config_json(nlohmann::json::array()).has_value());
  }
}

TEST_CASE("config_to_json is accepted by the loader", "[config][load]") {
  const auto original = config::default_engine_config(config::kDynamicThresholdV3Policy);
  const auto serialized = config::config_to_json(original);

  auto reloaded = config::load_engine_config_json(serialized);
  REQUIRE(reloaded.has_value());
  REQUIRE(config::config_to_json(*reloaded.value()).dump() == serialized.dump());
}

TEST_CASE("load_engine_config_file reports unreadable paths", "[config][load]") {
  auto result = config::load_engine_config_file("/nonexistent/fitscore-config.json");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().find("cannot open") != std::string::npos);
}
