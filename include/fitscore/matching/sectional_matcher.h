#pragma once

#include "fitscore/config/engine_config.h"
#include "fitscore/core/result.h"
#include "fitscore/domain/candidate_profile.h"
#include "fitscore/domain/match_result.h"
#include "fitscore/domain/requirement.h"
#include "fitscore/matching/match_error.h"
#include "fitscore/matching/synonym_expander.h"
#include "fitscore/matching/threshold_resolver.h"

namespace fitscore::matching {

struct SectionMatch {
  domain::SectionOutcome required;   // NOLINT(readability-identifier-naming)
  domain::SectionOutcome preferred;  // NOLINT(readability-identifier-naming)
};

// SectionalMatcher scores the required and preferred items of a position against one
// candidate, producing per-item evidence.
//
// - Skill items: lexical equality (canonical or alias, reported as similarity 1.0) against
//   candidate skills, else the best embedding similarity between the item vector and the
//   candidates' narrative context vectors.
// - Sentence items: best similarity against every candidate narrative sentence. The threshold
//   comes from the item's dominant technology term, or the global default.
// - A similarity match is rejected when the conflict-group veto fires on the best candidate.
// - Section score = matched weight / total weight; critical required items weigh
//   params.critical_weight. An empty section scores 1.0; a candidate with nothing to compare
//   scores 0.0 and is marked candidate_empty.
// - Malformed items are degraded to unmatched and listed in degraded_items.
// - A vector dimension mismatch aborts with MatchError{kDimensionMismatch}.
//
// Holds references: config, expander and resolver must outlive the matcher.
class SectionalMatcher {
 public:
  SectionalMatcher(const config::EngineConfig& config, const SynonymExpander& expander,
                   const ThresholdResolver& resolver);

  [[nodiscard]] core::Result<SectionMatch, MatchError> match(
      const domain::SectionRequirement& section, const domain::CandidateProfile& candidate) const;

  [[nodiscard]] core::Result<domain::SectionOutcome, MatchError> match_priority(
      const domain::SectionRequirement& section, domain::ItemPriority priority,
      const domain::CandidateProfile& candidate) const;

 private:
  [[nodiscard]] core::Result<domain::ItemEvidence, MatchError> match_skill_item(
      const domain::RequirementItem& item, const domain::CandidateProfile& candidate,
      const std::string& section_name) const;

  [[nodiscard]] core::Result<domain::ItemEvidence, MatchError> match_sentence_item(
      const domain::RequirementItem& item, const domain::CandidateProfile& candidate,
      const std::string& section_name) const;

  void finish_evidence(domain::ItemEvidence& evidence) const;

  const config::EngineConfig& config_;
  const SynonymExpander& expander_;
  const ThresholdResolver& resolver_;
};

}  // namespace fitscore::matching
