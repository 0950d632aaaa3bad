#pragma once

#include "fitscore/domain/levels.h"
#include "fitscore/domain/requirement.h"
#include "fitscore/vector/similarity.h"

#include <optional>
#include <string>
#include <vector>

namespace fitscore::domain {

// PositionProfile is the read-only input describing one open position.
// Required and preferred items share one SectionRequirement, split by ItemPriority.
struct PositionProfile {
  std::string position_id;
  std::string title;

  SectionRequirement requirements;

  vector::Vector profile_vector;      // whole-profile embedding (fast stage)
  vector::Vector description_vector;  // job description narrative

  double min_experience_years{0.0};
  std::optional<double> max_experience_years;
  std::optional<ExperienceLevel> level;

  std::vector<std::string> domain_tags;
  std::vector<std::string> role_tags;

  std::optional<EducationLevel> min_education;
  std::vector<std::string> required_certifications;
};

}  // namespace fitscore::domain
