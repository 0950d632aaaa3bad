#pragma once

#include "fitscore/config/synonym_table.h"
#include "fitscore/config/threshold_table.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fitscore::matching {

enum class ThresholdSource {
  kToken,         // explicit per-token entry
  kGroupDefault,  // token is in a conflict group with a default threshold
  kGlobal,        // global default
};

[[nodiscard]] std::string to_string(ThresholdSource source);

struct ThresholdResolution {
  double threshold{0.0};                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> group;       // conflict group of the token, if any
  ThresholdSource source{ThresholdSource::kGlobal};  // NOLINT(readability-identifier-naming)
};

// ThresholdResolver answers "how similar is similar enough" for a canonical token, and owns
// the conflict-group veto.
//
// Backed by one tagged lookup (token -> {optional threshold, optional group}) built from the
// ThresholdTable, so the anti-false-positive policy lives in a single structure.
// Resolution order: explicit token entry, then the token's group default, then the global
// default. Table keys and lookups are canonicalized through `synonyms`, so an entry written
// under an alias ("k8s", "golang") applies to its canonical token.
class ThresholdResolver {
 public:
  explicit ThresholdResolver(const config::ThresholdTable& table,
                             const config::SynonymTable& synonyms = {});

  [[nodiscard]] ThresholdResolution resolve(std::string_view token) const;
  [[nodiscard]] ThresholdResolution resolve_default() const;

  [[nodiscard]] std::optional<std::string> group_of(std::string_view token) const;

  // should_veto decides whether a similarity-based match of `required_token` against a
  // candidate item must be rejected.
  // - required token without a group: never vetoed
  // - candidate dominant token absent, or without a group: never vetoed
  // - same group: not vetoed
  // - different groups: vetoed unless `required_mentioned` (the required token or an alias
  //   appears lexically in the candidate item)
  [[nodiscard]] bool should_veto(std::string_view required_token,
                                 const std::optional<std::string>& candidate_dominant_token,
                                 bool required_mentioned) const;

  // Every canonical token known to the table, for term detection.
  [[nodiscard]] std::vector<std::string> vocabulary() const;

 private:
  struct Entry {
    std::optional<double> threshold;
    std::optional<std::string> group;
  };

  [[nodiscard]] std::string canonical_key(std::string_view token) const;

  std::map<std::string, std::string> surfaces_;  // surface form -> canonical
  double global_default_;
  std::map<std::string, Entry> entries_;
  std::map<std::string, double> group_defaults_;
};

}  // namespace fitscore::matching
