#pragma once

#include <string>
#include <vector>

namespace datamarket::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

enum class Dialect {
  kSqlite,
  kPostgres,
};

/*
  Ordered bootstrap statements for the ledger schema.

  Every statement is idempotent (IF NOT EXISTS / conflict-ignoring seed
  rows), so running the list against an existing database is a no-op.
*/
const std::vector<std::string>& LedgerSchema(Dialect dialect);

/*
  Runs migrations in order.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace datamarket::db::sql
