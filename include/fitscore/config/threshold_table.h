#pragma once

#include "fitscore/core/result.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fitscore::config {

// ConflictGroup is a named set of technologies treated as mutually exclusive for veto
// purposes (e.g. the JVM backends vs the Python backends). Tokens are canonical forms.
// `threshold`, when set, applies to member tokens without an explicit entry.
struct ConflictGroup {
  std::string name;                 // NOLINT(readability-identifier-naming)
  std::vector<std::string> tokens;  // NOLINT(readability-identifier-naming)
  std::optional<double> threshold;  // NOLINT(readability-identifier-naming)
};

// ThresholdTable holds per-token similarity thresholds, conflict groups with their default
// thresholds, and the global default.
// Invariants (checked at load): thresholds in [0, 1]; a token belongs to at most one group;
// group names are unique.
struct ThresholdTable {
  double global_default{0.6};                      // NOLINT(readability-identifier-naming)
  std::map<std::string, double> token_thresholds;  // canonical token -> threshold
  std::vector<ConflictGroup> groups;               // NOLINT(readability-identifier-naming)

  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

}  // namespace fitscore::config
