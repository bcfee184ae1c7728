#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace market::db::memory {

/*
  Works on a private copy of the committed state.

  Commit installs the copy if no other transaction committed since it was
  taken, otherwise it raises util::StateConflict.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void DoCommit() override;
  void DoRollback() override;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
};

} // namespace market::db::memory
