#include "fitscore/matching/penalty_engine.h"

#include <set>

namespace fitscore::matching {

PenaltyBreakdown PenaltyEngine::compute(const PenaltyInputs& inputs) const {
  const bool skills_missing =
      inputs.required_total > 0 &&
      static_cast<double>(inputs.required_missing) / static_cast<double>(inputs.required_total) >
          params_.missing_ratio_trigger;

  const auto fires = [&](const domain::PenaltyKind kind) {
    switch (kind) {
      case domain::PenaltyKind::kExperienceLevelMismatch:
        return inputs.level_mismatch;
      case domain::PenaltyKind::kExperienceSignificantlyLacking:
        return inputs.significantly_lacking;
      case domain::PenaltyKind::kDomainMismatch:
        return inputs.domain_mismatch;
      case domain::PenaltyKind::kRoleMismatch:
        return inputs.role_mismatch;
      case domain::PenaltyKind::kRequiredSkillMissing:
        return skills_missing;
      case domain::PenaltyKind::kRequiredSkillCriticalMissing:
        return inputs.critical_missing;
    }
    return false;
  };

  PenaltyBreakdown breakdown;
  double experience_raw = 0.0;

  for (const auto kind : domain::kAllPenaltyKinds) {
    if (!fires(kind) || rules_.magnitudes.count(kind) == 0) {
      continue;
    }
    const double magnitude = rules_.magnitude_of(kind);
    breakdown.applied.push_back(domain::AppliedPenalty{kind, magnitude, magnitude});
    if (domain::is_experience_penalty(kind)) {
      experience_raw += magnitude;
    } else {
      breakdown.other_total += magnitude;
    }
  }

  breakdown.experience_total = experience_raw;
  if (experience_raw > rules_.experience_penalty_cap) {
    const double scale = rules_.experience_penalty_cap / experience_raw;
    for (auto& penalty : breakdown.applied) {
      if (domain::is_experience_penalty(penalty.kind)) {
        penalty.magnitude = penalty.raw_magnitude * scale;
      }
    }
    breakdown.experience_total = rules_.experience_penalty_cap;
    breakdown.experience_capped = true;
  }

  return breakdown;
}

bool PenaltyEngine::tags_disjoint(const std::vector<std::string>& required,
                                  const std::vector<std::string>& candidate,
                                  const SynonymExpander& expander) {
  std::set<std::string> wanted;
  for (const auto& tag : required) {
    const std::string canonical = expander.canonicalize(tag);
    if (!canonical.empty()) {
      wanted.insert(canonical);
    }
  }
  if (wanted.empty()) {
    return false;
  }

  for (const auto& tag : candidate) {
    if (wanted.count(expander.canonicalize(tag)) > 0) {
      return false;
    }
  }
  return true;
}

}  // namespace fitscore::matching
