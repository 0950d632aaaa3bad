#include "fitscore/config/presets.h"
#include "fitscore/matching/credential_matcher.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace fitscore;

TEST_CASE("Education score", "[matching][credentials]") {
  using domain::EducationLevel;
  using matching::CredentialMatcher;

  REQUIRE(CredentialMatcher::education_score(std::nullopt, std::nullopt) == 1.0);
  REQUIRE(CredentialMatcher::education_score(EducationLevel::kNone, std::nullopt) == 1.0);
  REQUIRE(CredentialMatcher::education_score(EducationLevel::kBachelor,
                                             EducationLevel::kMaster) == 1.0);
  REQUIRE(CredentialMatcher::education_score(EducationLevel::kBachelor,
                                             EducationLevel::kBachelor) == 1.0);
  REQUIRE(CredentialMatcher::education_score(EducationLevel::kBachelor, std::nullopt) == 0.0);
  CHECK_THAT(CredentialMatcher::education_score(EducationLevel::kMaster,
                                                EducationLevel::kBachelor),
             Catch::Matchers::WithinAbs(2.0 / 3.0, 1e-12));
}

TEST_CASE("Certification coverage", "[matching][credentials]") {
  const matching::SynonymExpander expander(config::default_synonym_table());
  const matching::CredentialMatcher matcher(expander);

  SECTION("no requirement scores one") {
    const auto outcome = matcher.certification({}, {"CKA"});
    REQUIRE(outcome.score == 1.0);
    REQUIRE(outcome.missing.empty());
  }

  SECTION("certifications compare through synonyms") {
    const auto outcome = matcher.certification({"AWS", "CKA"}, {"Amazon Web Services"});
    REQUIRE(outcome.score == 0.5);
    REQUIRE(outcome.held == std::vector<std::string>{"amazon web services"});
    REQUIRE(outcome.missing == std::vector<std::string>{"cka"});
  }

  SECTION("duplicate requirements count once") {
    const auto outcome = matcher.certification({"CKA", "cka"}, {"CKA"});
    REQUIRE(outcome.score == 1.0);
  }
}
