#pragma once

#include <string>
#include <vector>

namespace deliveryiq::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Idempotent DDL (CREATE ... IF NOT EXISTS), in order.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace deliveryiq::db::sql
