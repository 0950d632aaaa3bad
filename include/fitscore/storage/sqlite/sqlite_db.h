#pragma once

#include "fitscore/core/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace fitscore::storage::sqlite {

// Schema version of the snapshot database, stored in PRAGMA user_version.
inline constexpr int kSnapshotSchemaVersion = 1;

// SqliteDb owns one connection to a match snapshot database.
//
// ":memory:" opens a private in-memory database. A file database waits up to a few seconds
// for another writer (e.g. a concurrent `fitscore_cli evaluate --db`) before failing.
// Not thread-safe: use one instance per thread.
class SqliteDb {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  // 0 for a database no migration has touched.
  [[nodiscard]] int schema_version() const;

  // migrate creates the match_snapshots table and stamps kSnapshotSchemaVersion in one
  // transaction. A database already at the current version is left alone; a newer one is an
  // error.
  [[nodiscard]] core::Result<bool, std::string> migrate();

  [[nodiscard]] std::string last_error() const;

 private:
  friend class Statement;

  struct Closer {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, Closer> db_;
};

// Statement is one prepared statement over snapshot columns. Binds copy their values;
// indexes are 1-based for binds and 0-based for columns, as in SQLite.
class Statement {
 public:
  Statement(const SqliteDb& db, std::string_view sql);

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] bool prepared() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  void bind_text(int index, const std::string& value);
  void bind_real(int index, double value);
  void bind_integer(int index, std::int64_t value);

  // next_row advances to the next result row; false once the rows are exhausted or on error.
  [[nodiscard]] bool next_row();

  // run executes a statement that returns no rows. On failure error() holds the reason.
  [[nodiscard]] bool run();

  [[nodiscard]] std::string text(int column) const;
  [[nodiscard]] double real(int column) const;
  [[nodiscard]] std::int64_t integer(int column) const;

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
  std::string error_;
};

}  // namespace fitscore::storage::sqlite
