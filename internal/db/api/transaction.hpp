#pragma once

namespace market::db {

/*
  Unit of work against a Repository.

  A transaction is Open until it is either committed or rolled back; both
  are final. Writes become visible to other transactions only on commit,
  and a transaction destroyed while Open is rolled back.

  Every public marketplace operation runs inside exactly one transaction,
  which is what makes a multi-item purchase all-or-nothing.

  Backends implement DoCommit/DoRollback:
    memory    snapshot swapped in on commit
    sqlite    BEGIN IMMEDIATE / COMMIT / ROLLBACK
    postgres  pqxx::work
*/

class Transaction {
 public:
  enum class State {
    kOpen,
    kCommitted,
    kRolledBack,
  };

  virtual ~Transaction() = default;

  Transaction(const Transaction&)            = delete;
  Transaction& operator=(const Transaction&) = delete;

  // Throws std::logic_error when the transaction is no longer open. A
  // failed commit leaves it open so the destructor can roll it back.
  void Commit();

  // No-op once finished.
  void Rollback();

  State state() const {
    return state_;
  }

  bool IsOpen() const {
    return state_ == State::kOpen;
  }

  bool IsCommitted() const {
    return state_ == State::kCommitted;
  }

 protected:
  Transaction() = default;

  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

  // For backend destructors: rolls back an open transaction and logs,
  // instead of throwing, when that fails.
  void AbandonIfOpen() noexcept;

 private:
  State state_ = State::kOpen;
};

} // namespace market::db
