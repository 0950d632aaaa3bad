#include "fitscore/matching/grade_classifier.h"

#include <algorithm>

namespace fitscore::matching {

GradeClassifier::GradeClassifier(const config::GradeThresholds& grades) : bands_(grades.bands) {
  std::stable_sort(bands_.begin(), bands_.end(),
                   [](const config::GradeBand& a, const config::GradeBand& b) {
                     return a.min_percent > b.min_percent;
                   });
}

std::string GradeClassifier::classify(const double percent) const {
  for (const auto& band : bands_) {
    if (band.min_percent <= percent) {
      return band.label;
    }
  }
  // Unreachable for validated tables (lowest band starts at 0, percent >= 0).
  return bands_.empty() ? std::string{} : bands_.back().label;
}

}  // namespace fitscore::matching
