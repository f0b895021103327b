#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace deliveryiq::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode) : db_(std::move(db)) {
  if (mode == Mode::kRead) {
    reader_ = db_->AcquireReader();
  }

  if (reader_) {
    SqliteDB::Exec(reader_.get(), "BEGIN DEFERRED;");
    return;
  }

  lock_ = db_->TransactionLock();
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      SqliteDB::Exec(Handle(), "ROLLBACK;");
    } catch (const std::exception& e) {
      DELIVERYIQ_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  SqliteDB::Exec(Handle(), "COMMIT;");
  finished_ = true;
  Release();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  try {
    SqliteDB::Exec(Handle(), "ROLLBACK;");
  } catch (const std::exception&) {
    Release();
    throw;
  }
  Release();
}

void SqliteTransaction::Release() {
  reader_.reset();
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace deliveryiq::db::sqlite
