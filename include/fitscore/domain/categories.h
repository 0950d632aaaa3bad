#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace fitscore::domain {

// Scoring categories combined by the aggregator. Order is the reporting order.
enum class Category {
  kRequired,
  kPreferred,
  kExperience,
  kOverall,
  kEducation,
  kCertification,
};

inline constexpr std::array<Category, 6> kAllCategories = {
    Category::kRequired,  Category::kPreferred, Category::kExperience,
    Category::kOverall,   Category::kEducation, Category::kCertification,
};

// Penalty kinds. Experience-origin kinds share the experience cap.
enum class PenaltyKind {
  kExperienceLevelMismatch,
  kExperienceSignificantlyLacking,
  kDomainMismatch,
  kRoleMismatch,
  kRequiredSkillMissing,
  kRequiredSkillCriticalMissing,
};

inline constexpr std::array<PenaltyKind, 6> kAllPenaltyKinds = {
    PenaltyKind::kExperienceLevelMismatch,
    PenaltyKind::kExperienceSignificantlyLacking,
    PenaltyKind::kDomainMismatch,
    PenaltyKind::kRoleMismatch,
    PenaltyKind::kRequiredSkillMissing,
    PenaltyKind::kRequiredSkillCriticalMissing,
};

[[nodiscard]] std::string to_string(Category category);
[[nodiscard]] std::string to_string(PenaltyKind kind);

[[nodiscard]] std::optional<Category> parse_category(std::string_view name);
[[nodiscard]] std::optional<PenaltyKind> parse_penalty_kind(std::string_view name);

[[nodiscard]] bool is_experience_penalty(PenaltyKind kind);

}  // namespace fitscore::domain
