#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace deliveryiq::db::sqlite {

/*
  SQLite transaction wrapper.

  kWrite uses BEGIN IMMEDIATE on the shared connection:
    - grabs write lock early
    - avoids deadlock-y behavior later
    - the process-side lock is held until Commit() or Rollback()

  kRead uses BEGIN DEFERRED on a pooled read-only connection and takes no
  process-side lock. In-memory databases fall back to kWrite.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  enum class Mode { kWrite, kRead };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kWrite);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return reader_ ? reader_.get() : db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

 private:
  void Release();

  std::shared_ptr<SqliteDB>    db_;
  std::shared_ptr<sqlite3>     reader_;
  std::unique_lock<std::mutex> lock_;
  bool                         finished_ = false;
};

} // namespace deliveryiq::db::sqlite
