#include "fitscore/config/presets.h"
#include "fitscore/matching/penalty_engine.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace fitscore;

using Catch::Matchers::WithinAbs;

static const domain::AppliedPenalty* find_penalty(const matching::PenaltyBreakdown& breakdown,
                                                  domain::PenaltyKind kind) {
  for (const auto& p : breakdown.applied) {
    if (p.kind == kind) {
      return &p;
    }
  }
  return nullptr;
}

TEST_CASE("Experience penalties share a cap", "[matching][penalties]") {
  SECTION("default magnitudes exceed the cap and are scaled") {
    const matching::PenaltyEngine engine(config::default_penalty_rules(),
                                         config::MatchingParams{});
    matching::PenaltyInputs inputs;
    inputs.level_mismatch = true;
    inputs.significantly_lacking = true;

    const auto breakdown = engine.compute(inputs);
    REQUIRE(breakdown.experience_capped);
    REQUIRE(breakdown.experience_total == 0.15);
    REQUIRE(breakdown.other_total == 0.0);

    const auto* level = find_penalty(breakdown, domain::PenaltyKind::kExperienceLevelMismatch);
    const auto* lacking =
        find_penalty(breakdown, domain::PenaltyKind::kExperienceSignificantlyLacking);
    REQUIRE(level != nullptr);
    REQUIRE(lacking != nullptr);
    REQUIRE(level->raw_magnitude == 0.25);
    CHECK_THAT(level->magnitude + lacking->magnitude, WithinAbs(0.15, 1e-12));
    REQUIRE(level->magnitude > lacking->magnitude);
  }

  SECTION("cap holds for arbitrarily large magnitudes") {
    config::PenaltyRules rules;
    rules.magnitudes[domain::PenaltyKind::kExperienceLevelMismatch] = 1.0;
    rules.magnitudes[domain::PenaltyKind::kExperienceSignificantlyLacking] = 1.0;
    rules.experience_penalty_cap = 0.1;
    const matching::PenaltyEngine engine(rules, config::MatchingParams{});

    matching::PenaltyInputs inputs;
    inputs.level_mismatch = true;
    inputs.significantly_lacking = true;
    REQUIRE(engine.compute(inputs).experience_total <= 0.1);
  }

  SECTION("a single penalty under the cap is untouched") {
    config::PenaltyRules rules;
    rules.magnitudes[domain::PenaltyKind::kExperienceLevelMismatch] = 0.1;
    const matching::PenaltyEngine engine(rules, config::MatchingParams{});

    matching::PenaltyInputs inputs;
    inputs.level_mismatch = true;
    const auto breakdown = engine.compute(inputs);
    REQUIRE_FALSE(breakdown.experience_capped);
    REQUIRE(breakdown.experience_total == 0.1);
  }
}

TEST_CASE("Skill, domain and role penalties are not capped", "[matching][penalties]") {
  const matching::PenaltyEngine engine(config::default_penalty_rules(), config::MatchingParams{});

  matching::PenaltyInputs inputs;
  inputs.domain_mismatch = true;
  inputs.role_mismatch = true;
  inputs.required_total = 4;
  inputs.required_missing = 3;
  inputs.critical_missing = true;

  const auto breakdown = engine.compute(inputs);
  REQUIRE(breakdown.applied.size() == 4);
  REQUIRE(breakdown.experience_total == 0.0);
  CHECK_THAT(breakdown.other_total, WithinAbs(0.75, 1e-12));
  CHECK_THAT(breakdown.total(), WithinAbs(0.75, 1e-12));
}

TEST_CASE("Required skill missing trigger is a strict ratio", "[matching][penalties]") {
  const matching::PenaltyEngine engine(config::default_penalty_rules(), config::MatchingParams{});

  matching::PenaltyInputs inputs;
  inputs.required_total = 4;

  inputs.required_missing = 2;
  REQUIRE(find_penalty(engine.compute(inputs), domain::PenaltyKind::kRequiredSkillMissing) ==
          nullptr);

  inputs.required_missing = 3;
  REQUIRE(find_penalty(engine.compute(inputs), domain::PenaltyKind::kRequiredSkillMissing) !=
          nullptr);

  inputs.required_total = 0;
  inputs.required_missing = 0;
  REQUIRE(engine.compute(inputs).applied.empty());
}

TEST_CASE("Kinds without a magnitude never fire", "[matching][penalties]") {
  config::PenaltyRules rules;
  rules.magnitudes[domain::PenaltyKind::kRoleMismatch] = 0.1;
  const matching::PenaltyEngine engine(rules, config::MatchingParams{});

  matching::PenaltyInputs inputs;
  inputs.domain_mismatch = true;
  inputs.role_mismatch = true;

  const auto breakdown = engine.compute(inputs);
  REQUIRE(breakdown.applied.size() == 1);
  REQUIRE(breakdown.applied[0].kind == domain::PenaltyKind::kRoleMismatch);
}

TEST_CASE("tags_disjoint compares canonical tags", "[matching][penalties]") {
  const matching::SynonymExpander expander(config::default_synonym_table());

  REQUIRE_FALSE(matching::PenaltyEngine::tags_disjoint({"FinTech"}, {"fintech"}, expander));
  REQUIRE(matching::PenaltyEngine::tags_disjoint({"fintech"}, {"healthcare"}, expander));
  REQUIRE(matching::PenaltyEngine::tags_disjoint({"fintech"}, {}, expander));
  REQUIRE_FALSE(matching::PenaltyEngine::tags_disjoint({}, {"healthcare"}, expander));
  REQUIRE_FALSE(matching::PenaltyEngine::tags_disjoint({"ML"}, {"machine learning"}, expander));
}
