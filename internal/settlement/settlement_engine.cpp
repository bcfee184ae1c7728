#include "settlement_engine.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/settlement/settlement_split.hpp"
#include "internal/util/errors.hpp"

namespace market::settlement {

using namespace market::protocol::v1;
using market::observability::BoolField;
using market::observability::StringField;
using market::observability::UIntField;

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::AssetLedger> ledger,
                                   std::shared_ptr<access::AccessGuard> access)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), access_(std::move(access)) {
  if (!repository_ || !ledger_ || !access_) {
    throw std::invalid_argument("SettlementEngine requires a repository, a ledger and an access guard");
  }
}

PurchaseReceipt SettlementEngine::Purchase(const model::InvocationContext& ctx, const model::Principal& purchaser, const std::string& shop,
                                           const Cart& cart) {
  if (ctx.caller != purchaser) {
    throw util::AuthorizationError("caller " + ctx.caller + " cannot purchase on behalf of " + purchaser);
  }

  auto       tx              = repository_->Begin();
  const auto fee_destination = access_->FeeDestination(*tx);

  PurchaseReceipt receipt;
  receipt.set_shop(shop);
  receipt.set_purchaser(purchaser);

  for (int i = 0; i < cart.items_size(); ++i) {
    *receipt.add_items() = Settle(*tx, cart.items(i), purchaser, fee_destination, shop);
  }

  tx->Commit();

  auto& metrics = market::observability::Metrics::Instance();
  for (const auto& item : receipt.items()) {
    metrics.AddSettledValue("fee", item.fee_share());
    metrics.AddSettledValue("publisher", item.publisher_share());
    metrics.AddSettledValue("producer", item.producer_share());
  }

  MARKET_LOG_INFO("purchase settled",
                  {StringField("purchaser", purchaser), StringField("shop", shop), UIntField("items", static_cast<uint64_t>(cart.items_size()))});
  return receipt;
}

SettlementEngine::ResolvedItem SettlementEngine::Resolve(db::Transaction& tx, const CartItem& item, const std::string& shop) {
  ResolvedItem resolved;
  uint64_t     product_id = item.reference_id();

  if (item.affiliate()) {
    auto request = repository_->GetRequest(tx, item.reference_id());
    if (!request) {
      throw util::NotFound("request " + std::to_string(item.reference_id()));
    }
    if (request->status != REQUEST_STATUS_ACCEPTED) {
      throw util::StateConflict("request " + std::to_string(request->id) + " is not accepted");
    }
    if (request->publisher != shop) {
      throw util::AuthorizationError("request " + std::to_string(request->id) + " belongs to " + request->publisher + ", not " + shop);
    }
    product_id         = request->product_id;
    resolved.publisher = request->publisher;
  }

  auto product = repository_->GetProduct(tx, product_id);
  if (!product) {
    throw util::NotFound("product " + std::to_string(product_id));
  }
  resolved.product = std::move(*product);
  return resolved;
}

ItemSettlement SettlementEngine::Settle(db::Transaction& tx, const CartItem& item, const model::Principal& purchaser,
                                        const model::Principal& fee_destination, const std::string& shop) {
  if (item.amount() == 0) {
    throw util::ValidationError("cart item " + std::to_string(item.reference_id()) + " has zero amount");
  }

  const auto resolved = Resolve(tx, item, shop);
  const auto& product = resolved.product;
  const auto split    = ComputeSplit(product.price, product.commission, item.affiliate());

  ledger_->TransferFunds(tx, split.fee_share, purchaser, fee_destination);
  if (item.affiliate()) {
    ledger_->TransferFunds(tx, split.publisher_share, purchaser, resolved.publisher);
  }
  ledger_->TransferFunds(tx, split.producer_share, purchaser, product.producer);
  ledger_->TransferAsset(tx, product.id, item.amount(), product.producer, purchaser);

  MARKET_LOG_DEBUG("item settled", {UIntField("product_id", product.id), BoolField("affiliate", item.affiliate()),
                                    UIntField("fee_share", split.fee_share), UIntField("publisher_share", split.publisher_share),
                                    UIntField("producer_share", split.producer_share), UIntField("amount", item.amount())});

  ItemSettlement settlement;
  settlement.set_product_id(product.id);
  settlement.set_amount(item.amount());
  settlement.set_fee_share(split.fee_share);
  settlement.set_publisher_share(split.publisher_share);
  settlement.set_producer_share(split.producer_share);
  settlement.set_publisher(resolved.publisher);
  settlement.set_producer(product.producer);
  return settlement;
}

} // namespace market::settlement
