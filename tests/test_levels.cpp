#include "fitscore/domain/levels.h"

#include <catch2/catch_test_macros.hpp>

using namespace fitscore;

TEST_CASE("Experience levels parse with aliases", "[domain][levels]") {
  REQUIRE(domain::parse_experience_level("Senior") == domain::ExperienceLevel::kSenior);
  REQUIRE(domain::parse_experience_level("  lead ") == domain::ExperienceLevel::kSenior);
  REQUIRE(domain::parse_experience_level("Entry Level") == domain::ExperienceLevel::kJunior);
  REQUIRE(domain::parse_experience_level("intermediate") == domain::ExperienceLevel::kMid);
  REQUIRE_FALSE(domain::parse_experience_level("wizard").has_value());
}

TEST_CASE("Education levels parse with aliases", "[domain][levels]") {
  REQUIRE(domain::parse_education_level("PhD") == domain::EducationLevel::kDoctorate);
  REQUIRE(domain::parse_education_level("BSc") == domain::EducationLevel::kBachelor);
  REQUIRE(domain::parse_education_level("masters") == domain::EducationLevel::kMaster);
  REQUIRE_FALSE(domain::parse_education_level("bootcamp").has_value());
}

TEST_CASE("Level names round-trip through to_string", "[domain][levels]") {
  REQUIRE(domain::to_string(domain::ExperienceLevel::kMid) == "mid");
  REQUIRE(domain::to_string(domain::EducationLevel::kAssociate) == "associate");
  REQUIRE(domain::parse_experience_level(domain::to_string(domain::ExperienceLevel::kJunior)) ==
          domain::ExperienceLevel::kJunior);
}

TEST_CASE("level_from_years tier boundaries", "[domain][levels]") {
  REQUIRE(domain::level_from_years(0.0) == domain::ExperienceLevel::kJunior);
  REQUIRE(domain::level_from_years(2.99) == domain::ExperienceLevel::kJunior);
  REQUIRE(domain::level_from_years(3.0) == domain::ExperienceLevel::kMid);
  REQUIRE(domain::level_from_years(6.99) == domain::ExperienceLevel::kMid);
  REQUIRE(domain::level_from_years(7.0) == domain::ExperienceLevel::kSenior);
}

TEST_CASE("tier_distance is symmetric", "[domain][levels]") {
  REQUIRE(domain::tier_distance(domain::ExperienceLevel::kJunior,
                                domain::ExperienceLevel::kSenior) == 2);
  REQUIRE(domain::tier_distance(domain::ExperienceLevel::kSenior,
                                domain::ExperienceLevel::kJunior) == 2);
  REQUIRE(domain::tier_distance(domain::ExperienceLevel::kMid, domain::ExperienceLevel::kMid) ==
          0);
}
