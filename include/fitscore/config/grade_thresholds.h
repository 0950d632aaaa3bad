#pragma once

#include "fitscore/core/result.h"

#include <string>
#include <vector>

namespace fitscore::config {

struct GradeBand {
  std::string label;         // NOLINT(readability-identifier-naming)
  double min_percent{0.0};   // inclusive lower bound on the 0-100 scale
};

// GradeThresholds lists bands from the highest minimum down.
// Invariants (checked at load): non-empty, labels non-empty and unique, minimums strictly
// descending, first minimum <= 100, last minimum == 0. Together these make the bands
// contiguous and exhaustive over [0, 100].
struct GradeThresholds {
  std::vector<GradeBand> bands;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

}  // namespace fitscore::config
