#include "repository_ledger.hpp"

#include <limits>
#include <utility>
#include <string>

#include "internal/db/api/db_error.hpp"
#include "internal/util/errors.hpp"

namespace market::ledger {

namespace {

uint64_t CheckedCredit(uint64_t current, uint64_t amount, const std::string& what) {
  if (amount > std::numeric_limits<uint64_t>::max() - current) {
    throw util::TransferRejected(what + " would overflow");
  }
  return current + amount;
}

} // namespace

RepositoryLedger::RepositoryLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t RepositoryLedger::Mint(db::Transaction& tx, const model::Principal& recipient, uint64_t amount) {
  if (recipient.empty()) {
    throw util::TransferRejected("mint recipient is empty");
  }

  const auto product_id = repository_->NextProductId(tx);
  db::ThrowIfDbError(repository_->SetHolding(tx, product_id, recipient, amount), "mint product " + std::to_string(product_id));
  return product_id;
}

void RepositoryLedger::TransferFunds(db::Transaction& tx, uint64_t amount, const model::Principal& from, const model::Principal& to) {
  if (amount == 0) {
    return;
  }
  if (from.empty() || to.empty()) {
    throw util::TransferRejected("fund transfer with empty account");
  }

  const auto from_balance = repository_->GetBalance(tx, from);
  if (from_balance < amount) {
    throw util::TransferRejected("insufficient balance for " + from + ": have " + std::to_string(from_balance) + ", need " +
                                 std::to_string(amount));
  }
  if (from == to) {
    return;
  }

  const auto to_balance = CheckedCredit(repository_->GetBalance(tx, to), amount, "balance of " + to);
  db::ThrowIfDbError(repository_->SetBalance(tx, from, from_balance - amount), "debit " + from);
  db::ThrowIfDbError(repository_->SetBalance(tx, to, to_balance), "credit " + to);
}

void RepositoryLedger::TransferAsset(db::Transaction& tx, uint64_t product_id, uint64_t amount, const model::Principal& from,
                                     const model::Principal& to) {
  if (amount == 0) {
    return;
  }
  if (from.empty() || to.empty()) {
    throw util::TransferRejected("asset transfer with empty account");
  }

  const auto from_holding = repository_->GetHolding(tx, product_id, from);
  if (from_holding < amount) {
    throw util::TransferRejected("insufficient holding of product " + std::to_string(product_id) + " for " + from + ": have " +
                                 std::to_string(from_holding) + ", need " + std::to_string(amount));
  }
  if (from == to) {
    return;
  }

  const auto to_holding = CheckedCredit(repository_->GetHolding(tx, product_id, to), amount, "holding of " + to);
  db::ThrowIfDbError(repository_->SetHolding(tx, product_id, from, from_holding - amount), "debit asset " + from);
  db::ThrowIfDbError(repository_->SetHolding(tx, product_id, to, to_holding), "credit asset " + to);
}

void RepositoryLedger::Deposit(db::Transaction& tx, const model::Principal& account, uint64_t amount) {
  if (account.empty()) {
    throw util::TransferRejected("deposit to empty account");
  }
  const auto balance = CheckedCredit(repository_->GetBalance(tx, account), amount, "balance of " + account);
  db::ThrowIfDbError(repository_->SetBalance(tx, account, balance), "deposit " + account);
}

uint64_t RepositoryLedger::BalanceOf(db::Transaction& tx, const model::Principal& account) {
  return repository_->GetBalance(tx, account);
}

uint64_t RepositoryLedger::HoldingOf(db::Transaction& tx, uint64_t product_id, const model::Principal& owner) {
  return repository_->GetHolding(tx, product_id, owner);
}

} // namespace market::ledger
