#include "pg_pool.hpp"

namespace datamarket::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::shared_ptr<pqxx::connection> PgPool::AcquirePrepared() {
  auto conn = Acquire();

  bool needs_prepare = false;
  {
    std::lock_guard lock(mutex_);
    needs_prepare = !prepared_.contains(conn.get());
  }

  if (needs_prepare) {
    PrepareStatements(*conn);
    std::lock_guard lock(mutex_);
    prepared_.insert(conn.get());
  }
  return conn;
}

void PgPool::ExecuteSQL(const std::string& sql) {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  tx.exec(sql);
  tx.commit();
}

// Installed lazily: the schema must exist before statements referencing it
// can be prepared, and migrations run through this same pool.
void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("next_counter", "UPDATE ledger_counters SET value=value+1 WHERE name=$1 RETURNING value");

  conn.prepare("read_counter", "SELECT value FROM ledger_counters WHERE name=$1");

  conn.prepare("insert_dataset",
               "INSERT INTO datasets(id,owner,name,metadata_url,category,price_per_use,access_count,active,created_at) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("get_dataset",
               "SELECT id,owner,name,metadata_url,category,price_per_use,access_count,active,created_at "
               "FROM datasets WHERE id=$1");

  conn.prepare("update_dataset",
               "UPDATE datasets SET name=$2,metadata_url=$3,category=$4,price_per_use=$5,access_count=$6,active=$7 WHERE id=$1");

  conn.prepare("insert_job",
               "INSERT INTO training_jobs(id,creator,name,computation_provider,status,result_url,total_cost,created_at,completed_at) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("insert_job_entry", "INSERT INTO training_job_datasets(job_id,position,dataset_id,price) VALUES($1,$2,$3,$4)");

  conn.prepare("get_job",
               "SELECT id,creator,name,computation_provider,status,result_url,total_cost,created_at,completed_at "
               "FROM training_jobs WHERE id=$1");

  conn.prepare("get_job_entries", "SELECT dataset_id,price FROM training_job_datasets WHERE job_id=$1 ORDER BY position");

  conn.prepare("update_job", "UPDATE training_jobs SET computation_provider=$2,status=$3,result_url=$4,completed_at=$5 WHERE id=$1");

  conn.prepare("get_balance", "SELECT identity,amount FROM balances WHERE identity=$1");

  conn.prepare("upsert_balance",
               "INSERT INTO balances(identity,amount) VALUES($1,$2) "
               "ON CONFLICT (identity) DO UPDATE SET amount=EXCLUDED.amount");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace datamarket::db::postgres
