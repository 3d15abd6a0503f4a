#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace artifact::db::sqlite {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool WalMode() const {
    return wal_mode_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  StatementPtr Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        wal_mode_;
};

/*
  Throws the store error matching an sqlite result code:

    SQLITE_CONSTRAINT                DuplicateError
    everything else but OK/ROW/DONE  PersistenceError
*/
void ThrowIfError(sqlite3* db, int rc, const std::string& what);

} // namespace artifact::db::sqlite
