#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace deliveryiq::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  - Each transaction holds its own connection until it finishes.
  - libpqxx connections are NOT thread-safe, never share one.
  - Acquire() blocks while max_connections are checked out.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>; releasing it
    returns the connection to the idle list
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

// Runs schema DDL inside one pqxx::work; Commit() must be called.
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::shared_ptr<PgPool> pool);

  void ExecuteSQL(const std::string& sql) override;
  void Commit();

 private:
  std::shared_ptr<pqxx::connection> conn_;
  pqxx::work                        work_;
};

} // namespace deliveryiq::db::postgres
