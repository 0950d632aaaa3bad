#include "fitscore/matching/experience_matcher.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace fitscore;

using Catch::Matchers::WithinAbs;

TEST_CASE("Experience years against the minimum", "[matching][experience]") {
  const matching::ExperienceMatcher matcher(config::MatchingParams{});
  const matching::ExperienceRequirement required{5.0, std::nullopt, std::nullopt};

  SECTION("meeting the minimum is a full fit") {
    const auto e = matcher.match(required, 5.0, domain::ExperienceLevel::kMid);
    REQUIRE(e.fit == 1.0);
    REQUIRE(e.shortfall_ratio == 0.0);
    REQUIRE_FALSE(e.significantly_lacking);
  }

  SECTION("small shortfall reduces fit proportionally") {
    const auto e = matcher.match(required, 4.0, domain::ExperienceLevel::kMid);
    CHECK_THAT(e.shortfall_ratio, WithinAbs(0.2, 1e-12));
    CHECK_THAT(e.fit, WithinAbs(0.8, 1e-12));
    REQUIRE_FALSE(e.significantly_lacking);
  }

  SECTION("large shortfall is significantly lacking") {
    const auto e = matcher.match(required, 2.0, domain::ExperienceLevel::kMid);
    CHECK_THAT(e.fit, WithinAbs(0.4, 1e-12));
    REQUIRE(e.significantly_lacking);
  }

  SECTION("no experience scores zero") {
    const auto e = matcher.match(required, 0.0, domain::ExperienceLevel::kJunior);
    REQUIRE(e.fit == 0.0);
    REQUIRE(e.significantly_lacking);
  }
}

TEST_CASE("Years above the maximum never penalize", "[matching][experience]") {
  const matching::ExperienceMatcher matcher(config::MatchingParams{});
  const matching::ExperienceRequirement required{3.0, 10.0, std::nullopt};

  const auto e = matcher.match(required, 20.0, domain::ExperienceLevel::kSenior);
  REQUIRE(e.fit == 1.0);
  REQUIRE(e.required_max_years == 10.0);
}

TEST_CASE("Level tier mismatch", "[matching][experience]") {
  const matching::ExperienceMatcher matcher(config::MatchingParams{});
  const matching::ExperienceRequirement required{0.0, std::nullopt,
                                                 domain::ExperienceLevel::kSenior};

  SECTION("two tiers apart is a mismatch") {
    const auto e = matcher.match(required, 10.0, domain::ExperienceLevel::kJunior);
    REQUIRE(e.level_mismatch);
    REQUIRE_FALSE(e.candidate_level_derived);
    CHECK_THAT(e.fit, WithinAbs(0.85, 1e-12));
  }

  SECTION("adjacent tiers are tolerated") {
    const auto e = matcher.match(required, 10.0, domain::ExperienceLevel::kMid);
    REQUIRE_FALSE(e.level_mismatch);
    REQUIRE(e.fit == 1.0);
  }

  SECTION("missing tier is derived from years") {
    const auto e = matcher.match(required, 1.0, std::nullopt);
    REQUIRE(e.candidate_level_derived);
    REQUIRE(e.candidate_level == domain::ExperienceLevel::kJunior);
    REQUIRE(e.level_mismatch);
  }

  SECTION("overqualified by two tiers is also a mismatch") {
    const matching::ExperienceRequirement junior_role{0.0, std::nullopt,
                                                      domain::ExperienceLevel::kJunior};
    const auto e = matcher.match(junior_role, 12.0, domain::ExperienceLevel::kSenior);
    REQUIRE(e.level_mismatch);
  }
}

TEST_CASE("Experience fit never drops below zero", "[matching][experience]") {
  const matching::ExperienceMatcher matcher(config::MatchingParams{});
  const matching::ExperienceRequirement required{10.0, std::nullopt,
                                                 domain::ExperienceLevel::kSenior};

  const auto e = matcher.match(required, 1.0, domain::ExperienceLevel::kJunior);
  REQUIRE(e.significantly_lacking);
  REQUIRE(e.level_mismatch);
  REQUIRE(e.fit == 0.0);
}

TEST_CASE("Experience matcher reads profiles", "[matching][experience]") {
  const matching::ExperienceMatcher matcher(config::MatchingParams{});

  domain::PositionProfile position;
  position.min_experience_years = 4.0;
  position.level = domain::ExperienceLevel::kMid;

  domain::CandidateProfile candidate;
  candidate.experience_years = 6.0;

  const auto e = matcher.match(position, candidate);
  REQUIRE(e.fit == 1.0);
  REQUIRE(e.candidate_level == domain::ExperienceLevel::kMid);
  REQUIRE(e.candidate_level_derived);
  REQUIRE(e.required_min_years == 4.0);
}
