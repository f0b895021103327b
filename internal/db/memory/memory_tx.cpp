#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace deliveryiq::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    working_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : *snapshot_;
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  finished_ = true;
  if (!working_) {
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::StorageError("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(working_));
  repo_.committed_version_++;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  finished_ = true;
}

} // namespace deliveryiq::db::memory
