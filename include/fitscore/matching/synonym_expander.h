#pragma once

#include "fitscore/config/synonym_table.h"
#include "fitscore/domain/skill_token.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fitscore::matching {

// DetectedTerm is one vocabulary hit inside free text.
struct DetectedTerm {
  std::string canonical;  // NOLINT(readability-identifier-naming)
  std::size_t count{0};   // non-overlapping occurrences, any surface form
  std::size_t first_position{0};  // byte offset of the first occurrence in normalized text
};

// SynonymExpander resolves raw skill strings against the static synonym table.
//
// Lookup is case-insensitive and whitespace-normalized. An alias resolves to its canonical
// entry. Unknown tokens pass through as their own canonical form with no aliases (the
// vocabulary is open-world).
//
// Immutable after construction; safe to share across threads.
class SynonymExpander {
 public:
  // extra_vocabulary adds bare canonical terms (e.g. tokens known only to the threshold
  // table) so that detect_terms() can find them in text.
  explicit SynonymExpander(const config::SynonymTable& table,
                           const std::vector<std::string>& extra_vocabulary = {});

  [[nodiscard]] domain::SkillToken expand(std::string_view raw) const;
  [[nodiscard]] std::string canonicalize(std::string_view raw) const;

  // same_skill reports lexical equality of two tokens after canonicalization.
  [[nodiscard]] bool same_skill(std::string_view a, std::string_view b) const;

  // mentions reports whether `token` (canonical or any alias) occurs on term boundaries in
  // `text`.
  [[nodiscard]] bool mentions(std::string_view text, const domain::SkillToken& token) const;

  // detect_terms finds vocabulary terms in text. Longer surface forms are claimed first and
  // their spans masked, so "spring boot" is not also counted as "spring". Surface forms listed
  // in SynonymTable::ambiguous_terms are skipped; write "golang" to be detected, not "go".
  // Results are ordered by canonical name.
  [[nodiscard]] std::vector<DetectedTerm> detect_terms(std::string_view text) const;

  // dominant_term picks the most frequent detected term; ties go to the earliest first
  // occurrence, then the longer canonical name, then lexicographic order.
  [[nodiscard]] std::optional<std::string> dominant_term(std::string_view text) const;

 private:
  std::map<std::string, domain::SkillToken> entries_;  // canonical -> token with aliases
  std::map<std::string, std::string> surface_to_canonical_;
  std::vector<std::string> surfaces_by_length_;  // detectable forms, longest first
};

}  // namespace fitscore::matching
