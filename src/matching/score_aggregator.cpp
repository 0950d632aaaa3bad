#include "fitscore/matching/score_aggregator.h"

#include <algorithm>
#include <cmath>

namespace fitscore::matching {

double CategoryInputs::score_of(const domain::Category category) const {
  switch (category) {
    case domain::Category::kRequired:
      return required;
    case domain::Category::kPreferred:
      return preferred;
    case domain::Category::kExperience:
      return experience;
    case domain::Category::kOverall:
      return overall;
    case domain::Category::kEducation:
      return education;
    case domain::Category::kCertification:
      return certification;
  }
  return 0.0;
}

AggregateScore ScoreAggregator::aggregate(const CategoryInputs& inputs,
                                          const double penalty_total) const {
  AggregateScore result;
  result.categories.reserve(domain::kAllCategories.size());

  for (const auto category : domain::kAllCategories) {
    domain::CategoryScore score{category, inputs.score_of(category), weights_.weight_of(category)};
    result.weighted_sum += score.contribution();
    result.categories.push_back(score);
  }

  result.penalty_total = std::max(0.0, penalty_total);
  result.overall = std::clamp(result.weighted_sum - result.penalty_total, 0.0, 1.0);
  result.percent = to_percent(result.overall);
  return result;
}

double ScoreAggregator::to_percent(const double overall) {
  if (!std::isfinite(overall)) {
    return 0.0;
  }
  const double clamped = std::clamp(overall, 0.0, 1.0);
  return std::round(clamped * 1000.0) / 10.0;
}

}  // namespace fitscore::matching
