#pragma once

#include "fitscore/domain/levels.h"
#include "fitscore/vector/similarity.h"

#include <optional>
#include <string>
#include <vector>

namespace fitscore::domain {

// NarrativeSentence is one sentence of the candidate's experience/qualification narrative
// together with its embedding. An empty vector means the sentence was not embedded.
struct NarrativeSentence {
  std::string text;
  vector::Vector vector;
};

// CandidateSkill is an extracted skill fact. The engine does not decide what a skill is;
// `token` arrives already extracted, `context_text` is the surrounding narrative.
struct CandidateSkill {
  std::string token;
  std::string context_text;
  vector::Vector context_vector;
};

// CandidateProfile is the read-only input describing one candidate.
// Section vectors may be empty (absent section); all present vectors share one dimension.
struct CandidateProfile {
  std::string candidate_id;

  vector::Vector profile_vector;        // whole-profile embedding (fast stage)
  vector::Vector qualification_vector;  // qualification / skill narrative
  vector::Vector experience_vector;     // experience narrative
  vector::Vector project_vector;        // project narrative

  std::vector<NarrativeSentence> sentences;
  std::vector<CandidateSkill> skills;

  double experience_years{0.0};
  std::optional<ExperienceLevel> level;  // derived from years when absent

  std::vector<std::string> domain_tags;
  std::vector<std::string> role_tags;

  std::optional<EducationLevel> education;
  std::vector<std::string> certifications;

  [[nodiscard]] ExperienceLevel effective_level() const {
    return level.has_value() ? level.value() : level_from_years(experience_years);
  }
};

}  // namespace fitscore::domain
