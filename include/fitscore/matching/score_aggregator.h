#pragma once

#include "fitscore/config/weight_config.h"
#include "fitscore/domain/categories.h"
#include "fitscore/domain/match_result.h"

#include <vector>

namespace fitscore::matching {

// Per-category scores on the 0-1 scale (overall is a raw cosine and may be negative).
struct CategoryInputs {
  double required{0.0};       // NOLINT(readability-identifier-naming)
  double preferred{0.0};      // NOLINT(readability-identifier-naming)
  double experience{0.0};     // NOLINT(readability-identifier-naming)
  double overall{0.0};        // NOLINT(readability-identifier-naming)
  double education{0.0};      // NOLINT(readability-identifier-naming)
  double certification{0.0};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] double score_of(domain::Category category) const;
};

struct AggregateScore {
  std::vector<domain::CategoryScore> categories;  // NOLINT(readability-identifier-naming)
  double weighted_sum{0.0};                       // NOLINT(readability-identifier-naming)
  double penalty_total{0.0};                      // NOLINT(readability-identifier-naming)
  double overall{0.0};                            // clamped to [0, 1]
  double percent{0.0};                            // overall * 100, one decimal
};

// ScoreAggregator computes the convex combination sum(w_c * s_c), subtracts penalties,
// clamps to [0, 1] and scales to a percentage rounded to one decimal.
class ScoreAggregator {
 public:
  explicit ScoreAggregator(config::WeightConfig weights) : weights_(weights) {}

  [[nodiscard]] AggregateScore aggregate(const CategoryInputs& inputs,
                                         double penalty_total) const;

  // to_percent maps a 0-1 score to [0, 100] rounded to one decimal.
  [[nodiscard]] static double to_percent(double overall);

 private:
  config::WeightConfig weights_;
};

}  // namespace fitscore::matching
