#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace deliveryiq::db::memory {

/*
  Transaction = shared snapshot + lazily copied write set.

  Read-only transactions never copy. A writing transaction whose snapshot
  is no longer the committed one fails to commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           finished_         = false;
};

} // namespace deliveryiq::db::memory
