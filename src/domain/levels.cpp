#include "fitscore/domain/levels.h"

#include "fitscore/core/normalization.h"

#include <cstdlib>

namespace fitscore::domain {

std::string to_string(const ExperienceLevel level) {
  switch (level) {
    case ExperienceLevel::kJunior:
      return "junior";
    case ExperienceLevel::kMid:
      return "mid";
    case ExperienceLevel::kSenior:
      return "senior";
  }
  return "unknown";
}

std::string to_string(const EducationLevel level) {
  switch (level) {
    case EducationLevel::kNone:
      return "none";
    case EducationLevel::kAssociate:
      return "associate";
    case EducationLevel::kBachelor:
      return "bachelor";
    case EducationLevel::kMaster:
      return "master";
    case EducationLevel::kDoctorate:
      return "doctorate";
  }
  return "unknown";
}

std::optional<ExperienceLevel> parse_experience_level(const std::string_view text) {
  const std::string key = core::normalize_term(text);
  if (key == "junior" || key == "entry" || key == "entry level" || key == "new grad") {
    return ExperienceLevel::kJunior;
  }
  if (key == "mid" || key == "middle" || key == "intermediate" || key == "mid level") {
    return ExperienceLevel::kMid;
  }
  if (key == "senior" || key == "lead" || key == "principal" || key == "staff") {
    return ExperienceLevel::kSenior;
  }
  return std::nullopt;
}

std::optional<EducationLevel> parse_education_level(const std::string_view text) {
  const std::string key = core::normalize_term(text);
  if (key == "none" || key == "high school") {
    return EducationLevel::kNone;
  }
  if (key == "associate" || key == "associates") {
    return EducationLevel::kAssociate;
  }
  if (key == "bachelor" || key == "bachelors" || key == "bs" || key == "ba" || key == "bsc") {
    return EducationLevel::kBachelor;
  }
  if (key == "master" || key == "masters" || key == "ms" || key == "msc" || key == "ma") {
    return EducationLevel::kMaster;
  }
  if (key == "doctorate" || key == "phd" || key == "doctoral") {
    return EducationLevel::kDoctorate;
  }
  return std::nullopt;
}

ExperienceLevel level_from_years(const double years) {
  if (years < 3.0) {
    return ExperienceLevel::kJunior;
  }
  if (years < 7.0) {
    return ExperienceLevel::kMid;
  }
  return ExperienceLevel::kSenior;
}

int tier_distance(const ExperienceLevel a, const ExperienceLevel b) {
  return std::abs(static_cast<int>(a) - static_cast<int>(b));
}

}  // namespace fitscore::domain
