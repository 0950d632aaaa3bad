#include "fitscore/storage/match_snapshot_store.h"

#include "fitscore/core/hashing.h"

#include <algorithm>

namespace fitscore::storage {

MatchSnapshot make_snapshot(const domain::MatchResult& result) {
  MatchSnapshot snapshot;
  snapshot.snapshot_id =
      "snap-" + core::stable_hash64_hex(result.candidate_id + "|" + result.position_id + "|" +
                                        result.config_version + "|" +
                                        std::to_string(result.calculated_at));
  snapshot.candidate_id = result.candidate_id;
  snapshot.position_id = result.position_id;
  snapshot.config_version = result.config_version;
  snapshot.overall_percent = result.overall_percent;
  snapshot.grade = result.grade;
  snapshot.result_json = domain::match_result_to_json(result).dump();
  snapshot.calculated_at = result.calculated_at;
  return snapshot;
}

bool snapshot_rank_less(const MatchSnapshot& a, const MatchSnapshot& b) {
  if (a.overall_percent != b.overall_percent) {
    return a.overall_percent > b.overall_percent;
  }
  return a.snapshot_id < b.snapshot_id;
}

core::Result<bool, std::string> InMemoryMatchSnapshotStore::save(const MatchSnapshot& snapshot) {
  if (snapshot.snapshot_id.empty()) {
    return core::Result<bool, std::string>::err("snapshot_id must not be empty");
  }

  const auto it = std::find_if(
      snapshots_.begin(), snapshots_.end(),
      [&](const MatchSnapshot& s) { return s.snapshot_id == snapshot.snapshot_id; });
  if (it != snapshots_.end()) {
    *it = snapshot;
  } else {
    snapshots_.push_back(snapshot);
  }
  return core::Result<bool, std::string>::ok(true);
}

std::optional<MatchSnapshot> InMemoryMatchSnapshotStore::get(const std::string& snapshot_id) const {
  for (const auto& snapshot : snapshots_) {
    if (snapshot.snapshot_id == snapshot_id) {
      return snapshot;
    }
  }
  return std::nullopt;
}

std::vector<MatchSnapshot> InMemoryMatchSnapshotStore::list_by_position(
    const std::string& position_id) const {
  std::vector<MatchSnapshot> result;
  for (const auto& snapshot : snapshots_) {
    if (snapshot.position_id == position_id) {
      result.push_back(snapshot);
    }
  }
  std::sort(result.begin(), result.end(), snapshot_rank_less);
  return result;
}

}  // namespace fitscore::storage
