#pragma once

#include "fitscore/core/result.h"
#include "fitscore/domain/categories.h"

#include <string>

namespace fitscore::config {

// Tolerance for the "weights sum to 1.0" invariant.
inline constexpr double kWeightSumTolerance = 1e-6;

// WeightConfig holds the category weights of the convex combination computed by the
// score aggregator. Invariant (checked at load): all weights >= 0 and sum to 1.0.
struct WeightConfig {
  double required{0.0};       // NOLINT(readability-identifier-naming)
  double preferred{0.0};      // NOLINT(readability-identifier-naming)
  double experience{0.0};     // NOLINT(readability-identifier-naming)
  double overall{0.0};        // NOLINT(readability-identifier-naming)
  double education{0.0};      // NOLINT(readability-identifier-naming)
  double certification{0.0};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] double weight_of(domain::Category category) const;
  [[nodiscard]] double sum() const;

  // validate checks schema invariants.
  // Returns ok(true) if valid, err(message) if invalid.
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

}  // namespace fitscore::config
