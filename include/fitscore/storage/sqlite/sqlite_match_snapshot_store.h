#pragma once

#include "fitscore/storage/match_snapshot_store.h"
#include "fitscore/storage/sqlite/sqlite_db.h"

#include <memory>

namespace fitscore::storage::sqlite {

// SqliteMatchSnapshotStore persists MatchSnapshots to the match_snapshots table (schema v1).
// The caller must have migrated the database (SqliteDb::migrate).
//
// Deterministic ordering: list_by_position() orders by overall_percent DESC, snapshot_id ASC.
class SqliteMatchSnapshotStore final : public IMatchSnapshotStore {
 public:
  explicit SqliteMatchSnapshotStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> save(const MatchSnapshot& snapshot) override;

  [[nodiscard]] std::optional<MatchSnapshot> get(const std::string& snapshot_id) const override;

  [[nodiscard]] std::vector<MatchSnapshot> list_by_position(
      const std::string& position_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  // Column order: snapshot_id(0), candidate_id(1), position_id(2), config_version(3),
  //               overall_percent(4), grade(5), result_json(6), calculated_at(7)
  [[nodiscard]] static MatchSnapshot row_to_snapshot(const Statement& row);
};

}  // namespace fitscore::storage::sqlite
