#pragma once

#include "fitscore/config/engine_config.h"
#include "fitscore/domain/candidate_profile.h"
#include "fitscore/domain/levels.h"
#include "fitscore/domain/match_result.h"
#include "fitscore/domain/position_profile.h"

#include <optional>

namespace fitscore::matching {

struct ExperienceRequirement {
  double min_years{0.0};                             // NOLINT(readability-identifier-naming)
  std::optional<double> max_years;                   // NOLINT(readability-identifier-naming)
  std::optional<domain::ExperienceLevel> level;      // NOLINT(readability-identifier-naming)
};

// ExperienceMatcher scores years and level tier against a requirement.
//
// - fit starts at 1.0
// - years below min reduce fit by shortfall / min (floor 0); a shortfall ratio above
//   params.significant_shortfall_ratio raises significantly_lacking
// - a tier distance above one raises level_mismatch and subtracts
//   params.level_mismatch_reduction (floor 0)
// - years above max never penalize
// - a candidate without a tier is placed by years (level_from_years)
class ExperienceMatcher {
 public:
  explicit ExperienceMatcher(config::MatchingParams params) : params_(params) {}

  [[nodiscard]] domain::ExperienceEvidence match(
      const ExperienceRequirement& required, double candidate_years,
      std::optional<domain::ExperienceLevel> candidate_level) const;

  [[nodiscard]] domain::ExperienceEvidence match(const domain::PositionProfile& position,
                                                 const domain::CandidateProfile& candidate) const;

 private:
  config::MatchingParams params_;
};

}  // namespace fitscore::matching
