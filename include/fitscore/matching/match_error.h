#pragma once

#include "fitscore/core/result.h"

#include <string>

namespace fitscore::matching {

// MatchError aborts one detailed evaluation. `category` names the scoring category whose
// comparison failed (e.g. "required", "overall") so callers can report it precisely.
struct MatchError {
  core::MatchErrorKind kind{core::MatchErrorKind::kInvalidInput};  // NOLINT(readability-identifier-naming)
  std::string category;  // NOLINT(readability-identifier-naming)
  std::string message;   // NOLINT(readability-identifier-naming)
};

[[nodiscard]] inline std::string to_string(const core::MatchErrorKind kind) {
  return kind == core::MatchErrorKind::kDimensionMismatch ? "dimension_mismatch"
                                                          : "invalid_input";
}

}  // namespace fitscore::matching
