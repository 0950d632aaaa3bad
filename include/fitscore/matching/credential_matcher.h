#pragma once

#include "fitscore/domain/levels.h"
#include "fitscore/matching/synonym_expander.h"

#include <optional>
#include <string>
#include <vector>

namespace fitscore::matching {

struct CertificationOutcome {
  double score{1.0};                  // NOLINT(readability-identifier-naming)
  std::vector<std::string> held;      // required certifications the candidate holds
  std::vector<std::string> missing;   // NOLINT(readability-identifier-naming)
};

// CredentialMatcher scores the education and certification categories.
// Absent requirements score 1.0, like an empty requirement section.
class CredentialMatcher {
 public:
  explicit CredentialMatcher(const SynonymExpander& expander) : expander_(expander) {}

  // 1.0 when the candidate meets the minimum; otherwise candidate tier / required tier on the
  // ladder none < associate < bachelor < master < doctorate. An unknown candidate tier counts
  // as none.
  [[nodiscard]] static double education_score(
      std::optional<domain::EducationLevel> required,
      std::optional<domain::EducationLevel> candidate);

  // Fraction of required certifications held, compared after synonym canonicalization.
  [[nodiscard]] CertificationOutcome certification(
      const std::vector<std::string>& required, const std::vector<std::string>& held) const;

 private:
  const SynonymExpander& expander_;
};

}  // namespace fitscore::matching
