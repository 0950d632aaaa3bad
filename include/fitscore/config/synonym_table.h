#pragma once

#include "fitscore/core/result.h"

#include <map>
#include <string>
#include <vector>

namespace fitscore::config {

struct SynonymEntry {
  std::string canonical;             // NOLINT(readability-identifier-naming)
  std::vector<std::string> aliases;  // NOLINT(readability-identifier-naming)
};

// SynonymTable is the static technology vocabulary. Matching is case-insensitive.
// Invariant (checked at load): a surface form (canonical or alias) resolves to exactly one
// canonical entry.
struct SynonymTable {
  std::vector<SynonymEntry> entries;  // NOLINT(readability-identifier-naming)

  // Surface forms that are also ordinary words ("go", single letters). They still resolve
  // as skill tokens and thresholds but are never detected in free text.
  std::vector<std::string> ambiguous_terms;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] core::Result<bool, std::string> validate() const;

  // Normalized surface form (canonical or alias) -> normalized canonical form.
  [[nodiscard]] std::map<std::string, std::string> surface_index() const;
};

}  // namespace fitscore::config
