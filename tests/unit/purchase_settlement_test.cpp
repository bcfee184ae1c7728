#include <cassert>
#include <iostream>
#include <memory>
#include <utility>

#include "internal/model/principal.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/market_fixture.hpp"

namespace {

using market::model::CalledBy;
using market::testing::Item;
using market::testing::kAdmin;
using market::testing::kProducer;
using market::testing::kPublisher;
using market::testing::kPurchaser;
using market::testing::MarketFixture;
using market::testing::Metadata;
using market::testing::Throws;
using market::util::AuthorizationError;
using market::util::NotFound;
using market::util::StateConflict;
using market::util::TransferRejected;
using market::util::ValidationError;
using namespace market::protocol::v1;

// Applies transfers through the real ledger but refuses asset moves of one product.
class RefusingLedger final : public market::ledger::AssetLedger {
 public:
  RefusingLedger(std::shared_ptr<market::ledger::AssetLedger> inner, uint64_t refused_product)
      : inner_(std::move(inner)), refused_product_(refused_product) {
  }

  uint64_t Mint(market::db::Transaction& tx, const market::model::Principal& recipient, uint64_t amount) override {
    return inner_->Mint(tx, recipient, amount);
  }

  void TransferFunds(market::db::Transaction& tx, uint64_t amount, const market::model::Principal& from,
                     const market::model::Principal& to) override {
    inner_->TransferFunds(tx, amount, from, to);
  }

  void TransferAsset(market::db::Transaction& tx, uint64_t product_id, uint64_t amount, const market::model::Principal& from,
                     const market::model::Principal& to) override {
    if (product_id == refused_product_) {
      throw TransferRejected("asset transfer refused");
    }
    inner_->TransferAsset(tx, product_id, amount, from, to);
  }

  void Deposit(market::db::Transaction& tx, const market::model::Principal& account, uint64_t amount) override {
    inner_->Deposit(tx, account, amount);
  }

  uint64_t BalanceOf(market::db::Transaction& tx, const market::model::Principal& account) override {
    return inner_->BalanceOf(tx, account);
  }

  uint64_t HoldingOf(market::db::Transaction& tx, uint64_t product_id, const market::model::Principal& owner) override {
    return inner_->HoldingOf(tx, product_id, owner);
  }

 private:
  std::shared_ptr<market::ledger::AssetLedger> inner_;
  uint64_t                                     refused_product_;
};

struct SettlementFixture : MarketFixture {
  std::shared_ptr<market::settlement::SettlementEngine> engine =
      std::make_shared<market::settlement::SettlementEngine>(repository, ledger, access);

  uint64_t product_id = 0;
  uint64_t request_id = 0;

  SettlementFixture() {
    product_id = catalog->CreateProduct(CalledBy(kProducer), kProducer, Metadata(1000, 10, 10));
    request_id = lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
    lifecycle->AcceptRequest(CalledBy(kProducer), request_id, kProducer);
    Fund(kPurchaser, 5000);
  }

  PurchaseReceipt Buy(std::initializer_list<CartItem> items, const std::string& shop = kPublisher) {
    Cart cart;
    for (const auto& item : items) {
      *cart.add_items() = item;
    }
    return engine->Purchase(CalledBy(kPurchaser), kPurchaser, shop, cart);
  }

  void AssertUntouched() {
    assert(Balance(kPurchaser) == 5000);
    assert(Balance(kAdmin) == 0);
    assert(Balance(kPublisher) == 0);
    assert(Balance(kProducer) == 0);
    assert(Holding(product_id, kProducer) == 10);
    assert(Holding(product_id, kPurchaser) == 0);
  }
};

void TestAffiliatePurchaseSplitsThreeWays() {
  SettlementFixture fx;
  const auto        receipt = fx.Buy({Item(fx.request_id, true)});

  assert(receipt.shop() == kPublisher);
  assert(receipt.purchaser() == kPurchaser);
  assert(receipt.items_size() == 1);
  assert(receipt.items(0).product_id() == fx.product_id);
  assert(receipt.items(0).fee_share() == 10);
  assert(receipt.items(0).publisher_share() == 1);
  assert(receipt.items(0).producer_share() == 989);
  assert(receipt.items(0).publisher() == kPublisher);

  assert(fx.Balance(kAdmin) == 10);
  assert(fx.Balance(kPublisher) == 1);
  assert(fx.Balance(kProducer) == 989);
  assert(fx.Balance(kPurchaser) == 4000);
  assert(fx.Holding(fx.product_id, kPurchaser) == 1);
  assert(fx.Holding(fx.product_id, kProducer) == 9);
}

void TestDirectPurchasePaysNoCommission() {
  SettlementFixture fx;
  const auto        receipt = fx.Buy({Item(fx.product_id, false, 3)}, "ST2ANYSHOP");

  assert(receipt.shop() == "ST2ANYSHOP");
  assert(receipt.items(0).publisher_share() == 0);
  assert(receipt.items(0).publisher().empty());
  assert(fx.Balance(kAdmin) == 10);
  assert(fx.Balance(kProducer) == 990);
  assert(fx.Balance(kPublisher) == 0);
  assert(fx.Holding(fx.product_id, kPurchaser) == 3);
}

void TestFeeFollowsCurrentFeeDestination() {
  SettlementFixture fx;
  fx.access->SetFeeDestination(CalledBy(kAdmin), "ST2TREASURY");
  fx.Buy({Item(fx.product_id, false)});
  assert(fx.Balance("ST2TREASURY") == 10);
  assert(fx.Balance(kAdmin) == 0);
}

void TestPendingSecondItemRollsBackFirst() {
  SettlementFixture fx;
  const auto        pending_product = fx.catalog->CreateProduct(CalledBy(kProducer), kProducer, Metadata(500, 20, 10));
  const auto        pending_request = fx.lifecycle->CreateRequest(CalledBy(kPublisher), pending_product, kPublisher);

  assert(Throws<StateConflict>([&] { fx.Buy({Item(fx.request_id, true), Item(pending_request, true)}); }));
  fx.AssertUntouched();
  assert(fx.Holding(pending_product, kPurchaser) == 0);
}

void TestLedgerFailureRollsBackEarlierTransfers() {
  SettlementFixture fx;
  auto              refusing = std::make_shared<RefusingLedger>(fx.ledger, fx.product_id);
  market::settlement::SettlementEngine engine(fx.repository, refusing, fx.access);

  Cart cart;
  *cart.add_items() = Item(fx.request_id, true);
  assert(Throws<TransferRejected>([&] { engine.Purchase(CalledBy(kPurchaser), kPurchaser, kPublisher, cart); }));
  fx.AssertUntouched();
}

void TestCallerMustBePurchaser() {
  SettlementFixture fx;
  Cart              cart;
  *cart.add_items() = Item(fx.product_id, false);
  assert(Throws<AuthorizationError>([&] { fx.engine->Purchase(CalledBy("ST2OTHER"), kPurchaser, kPublisher, cart); }));
  fx.AssertUntouched();
}

void TestAffiliateShopMustMatchPublisher() {
  SettlementFixture fx;
  assert(Throws<AuthorizationError>([&] { fx.Buy({Item(fx.request_id, true)}, "ST2OTHERSHOP"); }));
  fx.AssertUntouched();
}

void TestUnknownReferencesAreNotFound() {
  SettlementFixture fx;
  assert(Throws<NotFound>([&] { fx.Buy({Item(404, true)}); }));
  assert(Throws<NotFound>([&] { fx.Buy({Item(404, false)}); }));
  fx.AssertUntouched();
}

void TestZeroAmountIsRejected() {
  SettlementFixture fx;
  assert(Throws<ValidationError>([&] { fx.Buy({Item(fx.product_id, false, 0)}); }));
  fx.AssertUntouched();
}

void TestInsufficientFundsAndStock() {
  SettlementFixture fx;
  // Five items at 1000 exhaust the deposit; the sixth cannot be paid.
  assert(Throws<TransferRejected>([&] {
    fx.Buy({Item(fx.product_id, false), Item(fx.product_id, false), Item(fx.product_id, false), Item(fx.product_id, false),
            Item(fx.product_id, false), Item(fx.product_id, false)});
  }));
  fx.AssertUntouched();

  assert(Throws<TransferRejected>([&] { fx.Buy({Item(fx.product_id, false, 11)}); }));
  fx.AssertUntouched();
}

void TestEmptyCartEchoesShop() {
  SettlementFixture fx;
  const auto        receipt = fx.Buy({});
  assert(receipt.shop() == kPublisher);
  assert(receipt.items_size() == 0);
  fx.AssertUntouched();
}

} // namespace

int main() {
  TestAffiliatePurchaseSplitsThreeWays();
  TestDirectPurchasePaysNoCommission();
  TestFeeFollowsCurrentFeeDestination();
  TestPendingSecondItemRollsBackFirst();
  TestLedgerFailureRollsBackEarlierTransfers();
  TestCallerMustBePurchaser();
  TestAffiliateShopMustMatchPublisher();
  TestUnknownReferencesAreNotFound();
  TestZeroAmountIsRejected();
  TestInsufficientFundsAndStock();
  TestEmptyCartEchoesShop();

  std::cout << "affiliate_market_unit_purchase_settlement: pass\n";
  return 0;
}
