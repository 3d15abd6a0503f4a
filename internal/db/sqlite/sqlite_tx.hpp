#pragma once

#include <memory>
#include <mutex>

#include "internal/metadata/metadata_index.hpp"
#include "sqlite_db.hpp"

namespace artifact::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  The connection is shared, so the writer mutex keeps other threads from
  issuing writes into this transaction.
*/
class SqliteTransaction final : public metadata::IndexTransaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::mutex& writer_mutex);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace artifact::db::sqlite
