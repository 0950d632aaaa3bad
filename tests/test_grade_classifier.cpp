#include "fitscore/config/presets.h"
#include "fitscore/matching/grade_classifier.h"

#include <catch2/catch_test_macros.hpp>

using namespace fitscore;

TEST_CASE("Grade bands have inclusive lower bounds", "[matching][grades]") {
  const matching::GradeClassifier classifier(config::default_grade_thresholds());

  REQUIRE(classifier.classify(100.0) == "excellent");
  REQUIRE(classifier.classify(85.0) == "excellent");
  REQUIRE(classifier.classify(84.9) == "good");
  REQUIRE(classifier.classify(70.0) == "good");
  REQUIRE(classifier.classify(69.9) == "fair");
  REQUIRE(classifier.classify(55.0) == "fair");
  REQUIRE(classifier.classify(40.0) == "caution");
  REQUIRE(classifier.classify(39.9) == "poor");
  REQUIRE(classifier.classify(0.0) == "poor");
}

TEST_CASE("Grade classifier orders bands itself", "[matching][grades]") {
  config::GradeThresholds grades;
  grades.bands = {{"low", 0.0}, {"high", 50.0}};

  const matching::GradeClassifier classifier(grades);
  REQUIRE(classifier.classify(50.0) == "high");
  REQUIRE(classifier.classify(49.9) == "low");
}
