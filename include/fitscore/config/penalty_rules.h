#pragma once

#include "fitscore/core/result.h"
#include "fitscore/domain/categories.h"

#include <map>
#include <string>

namespace fitscore::config {

// PenaltyRules maps each penalty kind to its deduction magnitude on the 0-1 scale.
// Kinds absent from `magnitudes` never deduct anything.
// experience_penalty_cap bounds the combined experience-origin deduction.
struct PenaltyRules {
  std::map<domain::PenaltyKind, double> magnitudes;  // NOLINT(readability-identifier-naming)
  double experience_penalty_cap{0.15};               // NOLINT(readability-identifier-naming)

  [[nodiscard]] double magnitude_of(domain::PenaltyKind kind) const;
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

}  // namespace fitscore::config
