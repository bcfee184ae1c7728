#include "memory_tx.hpp"

#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"

namespace market::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  AbandonIfOpen();
}

void MemoryTransaction::DoCommit() {
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw market::util::StateConflict("memory store changed since the transaction began");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
}

void MemoryTransaction::DoRollback() {
  working_ = MemoryRepository::State{};
}

} // namespace market::db::memory
