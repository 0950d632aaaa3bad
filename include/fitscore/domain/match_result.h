#pragma once

#include "fitscore/domain/categories.h"
#include "fitscore/domain/levels.h"
#include "fitscore/domain/requirement.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fitscore::domain {

// How a requirement item was satisfied.
enum class MatchBasis {
  kNone,      // not matched
  kLexical,   // canonical token or alias equality / term found in text
  kSemantic,  // embedding similarity at or above the resolved threshold
};

[[nodiscard]] std::string to_string(MatchBasis basis);

// ItemEvidence explains the decision for a single requirement item.
struct ItemEvidence {
  std::string item_id;                                // NOLINT(readability-identifier-naming)
  std::string text;                                   // NOLINT(readability-identifier-naming)
  ItemKind kind{ItemKind::kSentence};                 // NOLINT(readability-identifier-naming)
  bool critical{false};                               // NOLINT(readability-identifier-naming)
  double weight{1.0};                                 // NOLINT(readability-identifier-naming)
  bool matched{false};                                // NOLINT(readability-identifier-naming)
  MatchBasis basis{MatchBasis::kNone};                // NOLINT(readability-identifier-naming)
  double best_similarity{0.0};                        // NOLINT(readability-identifier-naming)
  double threshold{0.0};                              // NOLINT(readability-identifier-naming)
  std::optional<std::string> matched_candidate_item;  // skill token or sentence text
  std::optional<std::string> dominant_token;          // token that chose the threshold
  std::optional<std::string> conflict_group;          // group of dominant_token, if any
  bool vetoed{false};     // similarity passed but a conflict group veto rejected it
  bool near_miss{false};  // unmatched, within near_miss_margin of the threshold
  bool degraded{false};   // malformed item, scored as unmatched
};

// SectionOutcome is the scored result of one requirement priority (required or preferred).
struct SectionOutcome {
  std::string section;                       // "required" | "preferred"
  double score{1.0};                         // NOLINT(readability-identifier-naming)
  double matched_weight{0.0};                // NOLINT(readability-identifier-naming)
  double total_weight{0.0};                  // NOLINT(readability-identifier-naming)
  std::vector<ItemEvidence> items;           // requirement order preserved
  std::vector<std::string> matched_items;    // item ids
  std::vector<std::string> missing_items;    // item ids
  std::vector<std::string> degraded_items;   // item ids
  bool requirement_empty{false};             // NOLINT(readability-identifier-naming)
  bool candidate_empty{false};               // NOLINT(readability-identifier-naming)
  // Item kinds the section asks for that the candidate has nothing to compare against:
  // "skills" (no candidate skills) and/or "narrative" (no candidate sentences).
  std::vector<std::string> missing_material;  // NOLINT(readability-identifier-naming)

  // "matched/total" item counts, e.g. "3/4".
  [[nodiscard]] std::string match_rate() const;
};

struct ExperienceEvidence {
  double fit{1.0};                                // NOLINT(readability-identifier-naming)
  double candidate_years{0.0};                    // NOLINT(readability-identifier-naming)
  double required_min_years{0.0};                 // NOLINT(readability-identifier-naming)
  std::optional<double> required_max_years;       // NOLINT(readability-identifier-naming)
  double shortfall_ratio{0.0};                    // NOLINT(readability-identifier-naming)
  ExperienceLevel candidate_level{ExperienceLevel::kJunior};
  bool candidate_level_derived{false};            // tier came from years, not the profile
  std::optional<ExperienceLevel> required_level;  // NOLINT(readability-identifier-naming)
  bool significantly_lacking{false};              // NOLINT(readability-identifier-naming)
  bool level_mismatch{false};                     // NOLINT(readability-identifier-naming)
  double narrative_similarity{0.0};               // explanation only, never scored
};

struct CategoryScore {
  Category category{Category::kRequired};  // NOLINT(readability-identifier-naming)
  double score{0.0};                       // NOLINT(readability-identifier-naming)
  double weight{0.0};                      // NOLINT(readability-identifier-naming)

  [[nodiscard]] double contribution() const { return score * weight; }
};

struct AppliedPenalty {
  PenaltyKind kind{PenaltyKind::kDomainMismatch};  // NOLINT(readability-identifier-naming)
  double magnitude{0.0};      // value subtracted from the weighted sum
  double raw_magnitude{0.0};  // configured magnitude before the experience cap
};

// MatchResult is produced fresh for every detailed evaluation and never persisted by the
// engine. overall_percent is always in [0, 100], rounded to one decimal.
struct MatchResult {
  std::string candidate_id;    // NOLINT(readability-identifier-naming)
  std::string position_id;     // NOLINT(readability-identifier-naming)
  std::string config_version;  // NOLINT(readability-identifier-naming)
  std::string policy_version;  // NOLINT(readability-identifier-naming)

  double overall_percent{0.0};  // NOLINT(readability-identifier-naming)
  std::string grade;            // NOLINT(readability-identifier-naming)
  double weighted_sum{0.0};     // before penalties
  double penalty_total{0.0};    // NOLINT(readability-identifier-naming)

  std::vector<CategoryScore> categories;  // NOLINT(readability-identifier-naming)
  SectionOutcome required;                // NOLINT(readability-identifier-naming)
  SectionOutcome preferred;               // NOLINT(readability-identifier-naming)
  ExperienceEvidence experience;          // NOLINT(readability-identifier-naming)
  std::vector<AppliedPenalty> penalties;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> flags;         // sorted, unique

  std::int64_t calculated_at{0};  // microseconds since Unix epoch, from the injected clock

  [[nodiscard]] std::optional<double> category_score(Category category) const;
  [[nodiscard]] std::optional<double> penalty(PenaltyKind kind) const;
  [[nodiscard]] bool has_flag(const std::string& flag) const;
};

// Serialize a MatchResult to JSON.
// Keys are sorted alphabetically (nlohmann::json uses std::map internally).
// Includes schema_version and both the raw calculated_at and its ISO 8601 form.
[[nodiscard]] nlohmann::json match_result_to_json(const MatchResult& result);

}  // namespace fitscore::domain
