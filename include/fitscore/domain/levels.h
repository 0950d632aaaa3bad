#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fitscore::domain {

// Experience tiers are ordered: junior < mid < senior.
enum class ExperienceLevel {
  kJunior = 0,
  kMid = 1,
  kSenior = 2,
};

// Education tiers are ordered; a higher tier satisfies any lower minimum.
enum class EducationLevel {
  kNone = 0,
  kAssociate = 1,
  kBachelor = 2,
  kMaster = 3,
  kDoctorate = 4,
};

[[nodiscard]] std::string to_string(ExperienceLevel level);
[[nodiscard]] std::string to_string(EducationLevel level);

// Case-insensitive parsing. Accepts the to_string() names plus common aliases
// ("entry", "intermediate", "lead" / "phd", "bs", "ms", ...). Unknown input -> nullopt.
[[nodiscard]] std::optional<ExperienceLevel> parse_experience_level(std::string_view text);
[[nodiscard]] std::optional<EducationLevel> parse_education_level(std::string_view text);

// Tier implied by total years of experience: [0,3) junior, [3,7) mid, [7,inf) senior.
[[nodiscard]] ExperienceLevel level_from_years(double years);

// Absolute tier distance, e.g. junior vs senior == 2.
[[nodiscard]] int tier_distance(ExperienceLevel a, ExperienceLevel b);

}  // namespace fitscore::domain
