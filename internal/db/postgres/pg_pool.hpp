#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace datamarket::db::postgres {

/*
  PgPool

  Connection factory used by PgRepository.

  Design notes:
  -------------
  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe: do not share.
  - Prepared statements are installed per connection.
  - At most max_connections are live; Acquire blocks past that.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool>, public sql::MigrationExecutor {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a connection (no prepared statements guaranteed)
  std::shared_ptr<pqxx::connection> Acquire();

  // Acquire a connection with the ledger statements prepared
  std::shared_ptr<pqxx::connection> AcquirePrepared();

  // Runs one schema statement in its own transaction.
  void ExecuteSQL(const std::string& sql) override;

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
  std::unordered_set<const pqxx::connection*>    prepared_;
};

} // namespace datamarket::db::postgres
