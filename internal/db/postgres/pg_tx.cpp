#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace deliveryiq::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()), tx_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      DELIVERYIQ_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must die before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace deliveryiq::db::postgres
