#include "fitscore/matching/credential_matcher.h"

#include <set>

namespace fitscore::matching {

double CredentialMatcher::education_score(const std::optional<domain::EducationLevel> required,
                                          const std::optional<domain::EducationLevel> candidate) {
  if (!required.has_value() || required.value() == domain::EducationLevel::kNone) {
    return 1.0;
  }

  const int required_tier = static_cast<int>(required.value());
  const int candidate_tier =
      candidate.has_value() ? static_cast<int>(candidate.value()) : 0;
  if (candidate_tier >= required_tier) {
    return 1.0;
  }
  return static_cast<double>(candidate_tier) / static_cast<double>(required_tier);
}

CertificationOutcome CredentialMatcher::certification(
    const std::vector<std::string>& required, const std::vector<std::string>& held) const {
  CertificationOutcome outcome;

  std::set<std::string> wanted;
  for (const auto& cert : required) {
    const std::string canonical = expander_.canonicalize(cert);
    if (!canonical.empty()) {
      wanted.insert(canonical);
    }
  }
  if (wanted.empty()) {
    return outcome;
  }

  std::set<std::string> owned;
  for (const auto& cert : held) {
    owned.insert(expander_.canonicalize(cert));
  }

  for (const auto& cert : wanted) {
    if (owned.count(cert) > 0) {
      outcome.held.push_back(cert);
    } else {
      outcome.missing.push_back(cert);
    }
  }

  outcome.score = static_cast<double>(outcome.held.size()) / static_cast<double>(wanted.size());
  return outcome;
}

}  // namespace fitscore::matching
