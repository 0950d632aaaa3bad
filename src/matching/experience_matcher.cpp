#include "fitscore/matching/experience_matcher.h"

#include <algorithm>
#include <cmath>

namespace fitscore::matching {

domain::ExperienceEvidence ExperienceMatcher::match(
    const ExperienceRequirement& required, const double candidate_years,
    const std::optional<domain::ExperienceLevel> candidate_level) const {
  domain::ExperienceEvidence evidence;

  const double years = std::isfinite(candidate_years) ? std::max(0.0, candidate_years) : 0.0;
  evidence.candidate_years = years;
  evidence.required_min_years = required.min_years;
  evidence.required_max_years = required.max_years;
  evidence.required_level = required.level;
  evidence.candidate_level_derived = !candidate_level.has_value();
  evidence.candidate_level =
      candidate_level.has_value() ? candidate_level.value() : domain::level_from_years(years);

  double fit = 1.0;

  if (required.min_years > 0.0 && years < required.min_years) {
    evidence.shortfall_ratio = (required.min_years - years) / required.min_years;
    fit = std::max(0.0, 1.0 - evidence.shortfall_ratio);
    evidence.significantly_lacking =
        evidence.shortfall_ratio > params_.significant_shortfall_ratio;
  }

  if (required.level.has_value() &&
      domain::tier_distance(evidence.candidate_level, required.level.value()) > 1) {
    evidence.level_mismatch = true;
    fit = std::max(0.0, fit - params_.level_mismatch_reduction);
  }

  evidence.fit = fit;
  return evidence;
}

domain::ExperienceEvidence ExperienceMatcher::match(
    const domain::PositionProfile& position, const domain::CandidateProfile& candidate) const {
  const ExperienceRequirement required{position.min_experience_years,
                                       position.max_experience_years, position.level};
  return match(required, candidate.experience_years, candidate.level);
}

}  // namespace fitscore::matching
