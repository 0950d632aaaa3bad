#pragma once

#include "fitscore/domain/candidate_profile.h"
#include "fitscore/domain/position_profile.h"
#include "fitscore/embedding/embedding_provider.h"

#include <nlohmann/json.hpp>

namespace fitscore::embedding {

// Profile documents may carry vectors directly or only text. Explicit vectors are kept
// verbatim; any section given only as text is embedded with `embedder`.
//
// Candidate document keys:
//   candidate_id (required), profile_vector|profile_text, qualification_vector|qualification_text,
//   experience_vector|experience_text, project_vector|project_text,
//   sentences: [string | {text, vector}] or narrative: string (split into sentences); with
//   neither, the qualification, experience and project texts are split into sentences,
//   skills: [string | {token, context, context_vector}], experience_years, level,
//   domain_tags, role_tags, education, certifications
//
// Position document keys:
//   position_id (required), title, profile_vector|profile_text, description_vector|description,
//   required / preferred: [string | {id, text, kind, critical, vector}],
//   min_experience_years, max_experience_years, level, domain_tags, role_tags,
//   min_education, required_certifications
//
// A missing profile vector is embedded from the concatenation of all available text.
// Throws nlohmann::json::exception on missing required fields or type mismatches, and
// std::invalid_argument on unknown level names.
[[nodiscard]] domain::CandidateProfile build_candidate_profile(const nlohmann::json& doc,
                                                               const IEmbeddingProvider& embedder);

[[nodiscard]] domain::PositionProfile build_position_profile(const nlohmann::json& doc,
                                                             const IEmbeddingProvider& embedder);

}  // namespace fitscore::embedding
