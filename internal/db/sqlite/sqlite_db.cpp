#include "sqlite_db.hpp"

#include <filesystem>

#include "internal/util/errors.hpp"

namespace artifact::db::sqlite {

void ThrowIfError(sqlite3* db, int rc, const std::string& what) {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;

  const std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  switch (rc & 0xff) {
    case SQLITE_CONSTRAINT:
      throw util::DuplicateError(msg);
    default:
      throw util::PersistenceError(msg);
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)), wal_mode_(wal_mode) {
  const std::filesystem::path file(path_);
  if (file.has_parent_path()) {
    std::filesystem::create_directories(file.parent_path());
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::PersistenceError("open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    ThrowIfError(nullptr, rc, msg);
  }
}

StatementPtr SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIfError(db_, rc, "sqlite prepare");
  return StatementPtr(stmt);
}

void SqliteDB::Configure() {
  if (wal_mode_) {
    // WAL lets readers in other processes proceed while a writer holds the lock
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } else {
    Exec("PRAGMA synchronous=FULL;");
  }

  // wait for locks instead of failing immediately
  ThrowIfError(db_, sqlite3_busy_timeout(db_, 5000), "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace artifact::db::sqlite
