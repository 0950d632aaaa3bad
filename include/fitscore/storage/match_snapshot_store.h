#pragma once

#include "fitscore/core/result.h"
#include "fitscore/storage/match_snapshot.h"

#include <optional>
#include <string>
#include <vector>

namespace fitscore::storage {

// IMatchSnapshotStore persists caller-selected MatchSnapshots.
//
// list_by_position() orders by overall_percent descending, then snapshot_id ascending,
// giving a deterministic leaderboard that does not depend on insertion time.
class IMatchSnapshotStore {
 public:
  virtual ~IMatchSnapshotStore() = default;

  // Insert or replace a snapshot by snapshot_id.
  [[nodiscard]] virtual core::Result<bool, std::string> save(const MatchSnapshot& snapshot) = 0;

  // Retrieve a snapshot by snapshot_id. Returns nullopt if not found.
  [[nodiscard]] virtual std::optional<MatchSnapshot> get(const std::string& snapshot_id) const = 0;

  [[nodiscard]] virtual std::vector<MatchSnapshot> list_by_position(
      const std::string& position_id) const = 0;

 protected:
  IMatchSnapshotStore() = default;
  IMatchSnapshotStore(const IMatchSnapshotStore&) = default;
  IMatchSnapshotStore& operator=(const IMatchSnapshotStore&) = default;
  IMatchSnapshotStore(IMatchSnapshotStore&&) = default;
  IMatchSnapshotStore& operator=(IMatchSnapshotStore&&) = default;
};

// In-memory implementation. Ephemeral, lost on process exit. Intended for unit tests.
class InMemoryMatchSnapshotStore final : public IMatchSnapshotStore {
 public:
  [[nodiscard]] core::Result<bool, std::string> save(const MatchSnapshot& snapshot) override;

  [[nodiscard]] std::optional<MatchSnapshot> get(const std::string& snapshot_id) const override;

  [[nodiscard]] std::vector<MatchSnapshot> list_by_position(
      const std::string& position_id) const override;

 private:
  std::vector<MatchSnapshot> snapshots_;
};

// Shared ordering of list_by_position().
[[nodiscard]] bool snapshot_rank_less(const MatchSnapshot& a, const MatchSnapshot& b);

}  // namespace fitscore::storage
