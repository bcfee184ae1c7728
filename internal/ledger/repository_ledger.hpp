#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/asset_ledger.hpp"

namespace market::ledger {

// Ledger kept in the repository's balances and holdings tables.
class RepositoryLedger final : public AssetLedger {
 public:
  explicit RepositoryLedger(std::shared_ptr<db::Repository> repository);

  uint64_t Mint(db::Transaction& tx, const model::Principal& recipient, uint64_t amount) override;

  void TransferFunds(db::Transaction& tx, uint64_t amount, const model::Principal& from, const model::Principal& to) override;

  void TransferAsset(db::Transaction& tx, uint64_t product_id, uint64_t amount, const model::Principal& from,
                     const model::Principal& to) override;

  void Deposit(db::Transaction& tx, const model::Principal& account, uint64_t amount) override;

  uint64_t BalanceOf(db::Transaction& tx, const model::Principal& account) override;

  uint64_t HoldingOf(db::Transaction& tx, uint64_t product_id, const model::Principal& owner) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace market::ledger
