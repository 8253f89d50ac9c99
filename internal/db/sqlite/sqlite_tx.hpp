#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace datamarket::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's writer mutex, then runs BEGIN IMMEDIATE:
    - threads sharing the connection wait up to the busy timeout, then throw
    - other processes on the same file are ordered by sqlite's write lock
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return finished_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::timed_mutex> writer_;
  bool finished_ = false;
};

}
