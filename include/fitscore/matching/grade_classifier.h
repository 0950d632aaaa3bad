#pragma once

#include "fitscore/config/grade_thresholds.h"

#include <string>
#include <vector>

namespace fitscore::matching {

// GradeClassifier maps a percentage to the first band, scanning from the highest minimum
// downward, whose minimum is <= the percentage. Lower bounds are inclusive.
// Band contiguity is a load-time invariant (GradeThresholds::validate), not rechecked here.
class GradeClassifier {
 public:
  explicit GradeClassifier(const config::GradeThresholds& grades);

  [[nodiscard]] std::string classify(double percent) const;

 private:
  std::vector<config::GradeBand> bands_;  // highest minimum first
};

}  // namespace fitscore::matching
