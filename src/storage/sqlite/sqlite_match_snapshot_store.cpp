#include "fitscore/storage/sqlite/sqlite_match_snapshot_store.h"

namespace fitscore::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT snapshot_id, candidate_id, position_id, config_version, overall_percent, grade, "
    "result_json, calculated_at FROM match_snapshots ";

constexpr const char* kUpsert = R"(
    INSERT INTO match_snapshots
      (snapshot_id, candidate_id, position_id, config_version, overall_percent, grade,
       result_json, calculated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(snapshot_id) DO UPDATE SET
      candidate_id    = excluded.candidate_id,
      position_id     = excluded.position_id,
      config_version  = excluded.config_version,
      overall_percent = excluded.overall_percent,
      grade           = excluded.grade,
      result_json     = excluded.result_json,
      calculated_at   = excluded.calculated_at
  )";

}  // namespace

SqliteMatchSnapshotStore::SqliteMatchSnapshotStore(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteMatchSnapshotStore::save(const MatchSnapshot& snapshot) {
  Statement stmt(*db_, kUpsert);
  if (!stmt.prepared()) {
    return core::Result<bool, std::string>::err("Failed to prepare snapshot insert: " +
                                                stmt.error());
  }

  stmt.bind_text(1, snapshot.snapshot_id);
  stmt.bind_text(2, snapshot.candidate_id);
  stmt.bind_text(3, snapshot.position_id);
  stmt.bind_text(4, snapshot.config_version);
  stmt.bind_real(5, snapshot.overall_percent);
  stmt.bind_text(6, snapshot.grade);
  stmt.bind_text(7, snapshot.result_json);
  stmt.bind_integer(8, snapshot.calculated_at);

  if (!stmt.run()) {
    return core::Result<bool, std::string>::err("Failed to save snapshot " +
                                                snapshot.snapshot_id + ": " + stmt.error());
  }
  return core::Result<bool, std::string>::ok(true);
}

std::optional<MatchSnapshot> SqliteMatchSnapshotStore::get(const std::string& snapshot_id) const {
  Statement stmt(*db_, std::string(kSelectColumns) + "WHERE snapshot_id = ?");
  if (!stmt.prepared()) {
    return std::nullopt;
  }

  stmt.bind_text(1, snapshot_id);
  if (!stmt.next_row()) {
    return std::nullopt;
  }
  return row_to_snapshot(stmt);
}

std::vector<MatchSnapshot> SqliteMatchSnapshotStore::list_by_position(
    const std::string& position_id) const {
  Statement stmt(*db_, std::string(kSelectColumns) +
                           "WHERE position_id = ? ORDER BY overall_percent DESC, snapshot_id");
  if (!stmt.prepared()) {
    return {};
  }

  stmt.bind_text(1, position_id);

  std::vector<MatchSnapshot> result;
  while (stmt.next_row()) {
    result.push_back(row_to_snapshot(stmt));
  }
  return result;
}

MatchSnapshot SqliteMatchSnapshotStore::row_to_snapshot(const Statement& row) {
  MatchSnapshot snapshot;
  snapshot.snapshot_id = row.text(0);
  snapshot.candidate_id = row.text(1);
  snapshot.position_id = row.text(2);
  snapshot.config_version = row.text(3);
  snapshot.overall_percent = row.real(4);
  snapshot.grade = row.text(5);
  snapshot.result_json = row.text(6);
  snapshot.calculated_at = row.integer(7);
  return snapshot;
}

}  // namespace fitscore::storage::sqlite
