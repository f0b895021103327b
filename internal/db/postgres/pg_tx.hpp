#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace deliveryiq::db::postgres {

class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              finished_ = false;
};

} // namespace deliveryiq::db::postgres
