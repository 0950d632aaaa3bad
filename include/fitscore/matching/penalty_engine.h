#pragma once

#include "fitscore/config/engine_config.h"
#include "fitscore/domain/match_result.h"
#include "fitscore/matching/synonym_expander.h"

#include <cstddef>
#include <utility>
#include <string>
#include <vector>

namespace fitscore::matching {

// PenaltyInputs are the trigger conditions collected from the matchers.
struct PenaltyInputs {
  bool level_mismatch{false};         // NOLINT(readability-identifier-naming)
  bool significantly_lacking{false};  // NOLINT(readability-identifier-naming)
  bool domain_mismatch{false};        // NOLINT(readability-identifier-naming)
  bool role_mismatch{false};          // NOLINT(readability-identifier-naming)
  std::size_t required_total{0};      // required items evaluated
  std::size_t required_missing{0};    // required items left unmatched
  bool critical_missing{false};       // any critical required item unmatched
};

struct PenaltyBreakdown {
  std::vector<domain::AppliedPenalty> applied;  // in PenaltyKind order
  double experience_total{0.0};                 // <= experience_penalty_cap
  double other_total{0.0};                      // NOLINT(readability-identifier-naming)
  bool experience_capped{false};                // NOLINT(readability-identifier-naming)

  [[nodiscard]] double total() const { return experience_total + other_total; }
};

// PenaltyEngine turns trigger conditions into deductions.
//
// Each kind fires independently and deducts its configured magnitude; kinds without a
// configured magnitude never fire. Experience-origin deductions are summed and clamped to
// experience_penalty_cap, scaling each one proportionally when the cap binds. Skill, domain
// and role deductions are never capped.
class PenaltyEngine {
 public:
  PenaltyEngine(config::PenaltyRules rules, config::MatchingParams params)
      : rules_(std::move(rules)), params_(params) {}

  [[nodiscard]] PenaltyBreakdown compute(const PenaltyInputs& inputs) const;

  // tags_disjoint is true when `required` is non-empty and shares no tag with `candidate`
  // after synonym canonicalization.
  [[nodiscard]] static bool tags_disjoint(const std::vector<std::string>& required,
                                          const std::vector<std::string>& candidate,
                                          const SynonymExpander& expander);

 private:
  config::PenaltyRules rules_;
  config::MatchingParams params_;
};

}  // namespace fitscore::matching
