#include "fitscore/domain/categories.h"

namespace fitscore::domain {

std::string to_string(const Category category) {
  switch (category) {
    case Category::kRequired:
      return "required";
    case Category::kPreferred:
      return "preferred";
    case Category::kExperience:
      return "experience";
    case Category::kOverall:
      return "overall";
    case Category::kEducation:
      return "education";
    case Category::kCertification:
      return "certification";
  }
  return "unknown";
}

std::string to_string(const PenaltyKind kind) {
  switch (kind) {
    case PenaltyKind::kExperienceLevelMismatch:
      return "experience_level_mismatch";
    case PenaltyKind::kExperienceSignificantlyLacking:
      return "experience_significantly_lacking";
    case PenaltyKind::kDomainMismatch:
      return "domain_mismatch";
    case PenaltyKind::kRoleMismatch:
      return "role_mismatch";
    case PenaltyKind::kRequiredSkillMissing:
      return "required_skill_missing";
    case PenaltyKind::kRequiredSkillCriticalMissing:
      return "required_skill_critical_missing";
  }
  return "unknown";
}

std::optional<Category> parse_category(const std::string_view name) {
  for (const Category category : kAllCategories) {
    if (to_string(category) == name) {
      return category;
    }
  }
  return std::nullopt;
}

std::optional<PenaltyKind> parse_penalty_kind(const std::string_view name) {
  for (const PenaltyKind kind : kAllPenaltyKinds) {
    if (to_string(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

bool is_experience_penalty(const PenaltyKind kind) {
  return kind == PenaltyKind::kExperienceLevelMismatch ||
         kind == PenaltyKind::kExperienceSignificantlyLacking;
}

}  // namespace fitscore::domain
