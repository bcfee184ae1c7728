#pragma once

#include <memory>
#include <string>

#include "internal/access/access_guard.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/asset_ledger.hpp"
#include "internal/model/principal.hpp"
#include "market/protocol/v1.hpp"

namespace market::settlement {

/*
  Purchase settlement.

  Cart items are settled in order inside one transaction. The first item
  that fails aborts the purchase and the transaction rolls back, so no
  transfer from any item survives.

  Per item:
    fee share       -> fee destination
    publisher share -> publisher (affiliate items only)
    producer share  -> producer
    `amount` units of the product asset -> producer to purchaser
*/

class SettlementEngine {
 public:
  SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::AssetLedger> ledger,
                   std::shared_ptr<access::AccessGuard> access);

  market::protocol::v1::PurchaseReceipt Purchase(const model::InvocationContext& ctx, const model::Principal& purchaser,
                                                 const std::string& shop, const market::protocol::v1::Cart& cart);

 private:
  struct ResolvedItem {
    db::model::ProductRecord product;
    model::Principal         publisher;
  };

  ResolvedItem Resolve(db::Transaction& tx, const market::protocol::v1::CartItem& item, const std::string& shop);

  market::protocol::v1::ItemSettlement Settle(db::Transaction& tx, const market::protocol::v1::CartItem& item, const model::Principal& purchaser,
                                              const model::Principal& fee_destination, const std::string& shop);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<ledger::AssetLedger> ledger_;
  std::shared_ptr<access::AccessGuard> access_;
};

} // namespace market::settlement
