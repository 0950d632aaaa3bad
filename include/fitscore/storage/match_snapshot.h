#pragma once

#include "fitscore/domain/match_result.h"

#include <cstdint>
#include <string>

namespace fitscore::storage {

// MatchSnapshot is what a caller chooses to keep of a detailed evaluation. The engine never
// persists results itself; applications snapshot them through an IMatchSnapshotStore.
struct MatchSnapshot {
  std::string snapshot_id;     // NOLINT(readability-identifier-naming)
  std::string candidate_id;    // NOLINT(readability-identifier-naming)
  std::string position_id;     // NOLINT(readability-identifier-naming)
  std::string config_version;  // NOLINT(readability-identifier-naming)
  double overall_percent{0.0};  // NOLINT(readability-identifier-naming)
  std::string grade;           // NOLINT(readability-identifier-naming)
  std::string result_json;     // match_result_to_json(...).dump()
  std::int64_t calculated_at{0};  // NOLINT(readability-identifier-naming)
};

// make_snapshot captures a MatchResult. snapshot_id is derived deterministically from
// candidate, position, config version and calculated_at, so re-saving the same result
// overwrites instead of duplicating.
[[nodiscard]] MatchSnapshot make_snapshot(const domain::MatchResult& result);

}  // namespace fitscore::storage
