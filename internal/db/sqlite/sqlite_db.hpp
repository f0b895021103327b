#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace deliveryiq::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every write transaction of a repository, so
  they hold TransactionLock() until Commit() or Rollback(). Never open a
  second write transaction on the same thread while one is unfinished.

  Read transactions use pooled read-only connections instead and only see
  committed data.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  static void Exec(sqlite3* handle, const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  const std::string& Path() const {
    return path_;
  }

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

  // nullptr for in-memory databases, which cannot be opened twice.
  std::shared_ptr<sqlite3> AcquireReader();

 private:
  void Configure(bool wal_mode);
  void ReleaseReader(sqlite3* reader);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;

  std::mutex            readers_mutex_;
  std::vector<sqlite3*> idle_readers_;
};

} // namespace deliveryiq::db::sqlite
