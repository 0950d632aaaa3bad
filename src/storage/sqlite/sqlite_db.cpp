#include "fitscore/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <cstddef>

namespace fitscore::storage::sqlite {

namespace {

using MigrateResult = core::Result<bool, std::string>;

constexpr int kBusyTimeoutMs = 5000;

// overall_percent is bounded so a corrupt result can never be ranked.
constexpr const char* kSnapshotSchema = R"(
BEGIN;
CREATE TABLE IF NOT EXISTS match_snapshots (
  snapshot_id     TEXT PRIMARY KEY,
  candidate_id    TEXT NOT NULL,
  position_id     TEXT NOT NULL,
  config_version  TEXT NOT NULL,
  overall_percent REAL NOT NULL CHECK(overall_percent >= 0 AND overall_percent <= 100),
  grade           TEXT NOT NULL,
  result_json     TEXT NOT NULL,
  calculated_at   INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_match_snapshots_rank
  ON match_snapshots(position_id, overall_percent DESC, snapshot_id);
PRAGMA user_version = 1;
COMMIT;
)";

}  // namespace

void SqliteDb::Closer::operator()(sqlite3* db) const {
  sqlite3_close(db);
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using R = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                 nullptr);
  // sqlite3_open_v2 hands back a connection even on failure; it must still be closed.
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));
  if (rc != SQLITE_OK) {
    return R::err("cannot open snapshot database '" + path + "': " +
                  (raw != nullptr ? db->last_error() : std::string{"out of memory"}));
  }

  sqlite3_busy_timeout(raw, kBusyTimeoutMs);
  return R::ok(std::move(db));
}

int SqliteDb::schema_version() const {
  Statement stmt(*this, "PRAGMA user_version");
  if (!stmt.prepared() || !stmt.next_row()) {
    return 0;
  }
  return static_cast<int>(stmt.integer(0));
}

MigrateResult SqliteDb::migrate() {
  const int current = schema_version();
  if (current == kSnapshotSchemaVersion) {
    return MigrateResult::ok(true);
  }
  if (current > kSnapshotSchemaVersion) {
    return MigrateResult::err("snapshot database has schema version " + std::to_string(current) +
                              ", newer than supported version " +
                              std::to_string(kSnapshotSchemaVersion));
  }

  char* message = nullptr;
  if (sqlite3_exec(db_.get(), kSnapshotSchema, nullptr, nullptr, &message) != SQLITE_OK) {
    std::string error = message != nullptr ? message : last_error();
    sqlite3_free(message);
    sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, nullptr);
    return MigrateResult::err("snapshot schema migration failed: " + error);
  }
  return MigrateResult::ok(true);
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

void Statement::Finalizer::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

Statement::Statement(const SqliteDb& db, const std::string_view sql) : db_(db.db_.get()) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) !=
      SQLITE_OK) {
    error_ = sqlite3_errmsg(db_);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

void Statement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void Statement::bind_real(const int index, const double value) {
  sqlite3_bind_double(stmt_.get(), index, value);
}

void Statement::bind_integer(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
}

bool Statement::next_row() {
  const int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc != SQLITE_DONE) {
    error_ = sqlite3_errmsg(db_);
  }
  return false;
}

bool Statement::run() {
  if (sqlite3_step(stmt_.get()) != SQLITE_DONE) {
    error_ = sqlite3_errmsg(db_);
    return false;
  }
  return true;
}

std::string Statement::text(const int column) const {
  const unsigned char* value = sqlite3_column_text(stmt_.get(), column);
  if (value == nullptr) {
    return {};
  }
  const int size = sqlite3_column_bytes(stmt_.get(), column);
  return std::string(reinterpret_cast<const char*>(value),  // NOLINT
                     static_cast<std::size_t>(size));
}

double Statement::real(const int column) const {
  return sqlite3_column_double(stmt_.get(), column);
}

std::int64_t Statement::integer(const int column) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), column));
}

}  // namespace fitscore::storage::sqlite
