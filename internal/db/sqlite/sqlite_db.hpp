#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace datamarket::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Also the sqlite migration executor: the factory bootstraps the ledger
  schema through it before the repository is handed out.

  All transactions share this one connection, so writers are queued on
  WriterMutex() for up to BusyTimeout() before BEGIN IMMEDIATE runs.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(const std::string& path, bool wal_mode = true,
                    std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::timed_mutex& WriterMutex() {
    return writer_mutex_;
  }

  std::chrono::milliseconds BusyTimeout() const {
    return busy_timeout_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

 private:
  // Configure recommended PRAGMAs (journal mode, foreign keys, etc.)
  void Configure(bool wal_mode);

  sqlite3*                  db_ = nullptr;
  std::chrono::milliseconds busy_timeout_;

  // Held by the open transaction for its whole lifetime.
  std::timed_mutex writer_mutex_;
};

} // namespace datamarket::db::sqlite
