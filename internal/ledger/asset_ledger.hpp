#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "internal/model/principal.hpp"

namespace market::ledger {

/*
  Value and asset movements.

  Every call joins the caller's transaction, so a failed purchase rolls
  back transfers already applied for earlier cart items.

  Failed transfers raise util::TransferRejected.
*/

class AssetLedger {
 public:
  virtual ~AssetLedger() = default;

  // Creates a new product asset and credits `amount` units to `recipient`.
  virtual uint64_t Mint(db::Transaction& tx, const model::Principal& recipient, uint64_t amount) = 0;

  virtual void TransferFunds(db::Transaction& tx, uint64_t amount, const model::Principal& from, const model::Principal& to) = 0;

  virtual void TransferAsset(db::Transaction& tx, uint64_t product_id, uint64_t amount, const model::Principal& from,
                             const model::Principal& to) = 0;

  virtual void Deposit(db::Transaction& tx, const model::Principal& account, uint64_t amount) = 0;

  virtual uint64_t BalanceOf(db::Transaction& tx, const model::Principal& account) = 0;

  virtual uint64_t HoldingOf(db::Transaction& tx, uint64_t product_id, const model::Principal& owner) = 0;
};

} // namespace market::ledger
