#include <cassert>
#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/principal.hpp"
#include "internal/util/error_code.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/market_fixture.hpp"

namespace {

using market::model::CalledBy;
using market::testing::Item;
using market::testing::kProducer;
using market::testing::kPublisher;
using market::testing::kPurchaser;
using market::testing::Metadata;
using namespace market::protocol::v1;

ErrorCode CodeOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    return market::util::ToErrorCode(e);
  }
  return ERROR_CODE_OK;
}

market::factory::Runtime MakeRuntime() {
  return market::factory::BuildRuntime(market::config::ConfigLoader::Defaults());
}

void TestErrorCodeMapping() {
  using market::util::ToErrorCode;
  assert(ToErrorCode(market::util::AuthorizationError("x")) == ERROR_CODE_UNAUTHORIZED);
  assert(ToErrorCode(market::util::ValidationError("x")) == ERROR_CODE_VALIDATION);
  assert(ToErrorCode(market::util::NotFound("x")) == ERROR_CODE_NOT_FOUND);
  assert(ToErrorCode(market::util::StateConflict("x")) == ERROR_CODE_STATE_CONFLICT);
  assert(ToErrorCode(market::util::TransferRejected("x")) == ERROR_CODE_TRANSFER_REJECTED);
  assert(ToErrorCode(std::runtime_error("x")) == ERROR_CODE_INTERNAL);

  assert(ERROR_CODE_UNAUTHORIZED == 100);
}

void TestNonAdminSetAdminFailsWithUnauthorized() {
  auto  runtime = MakeRuntime();
  auto& market  = *runtime.service;

  const auto admin = market.GetAdmin();
  assert(admin == market::config::kDefaultBootstrapPrincipal);
  assert(CodeOf([&] { market.SetAdmin(CalledBy("ST2INTRUDER"), "ST2INTRUDER"); }) == ERROR_CODE_UNAUTHORIZED);
  assert(market.GetAdmin() == admin);

  market.SetAdmin(CalledBy(admin), "ST2NEWADMIN");
  assert(market.GetAdmin() == "ST2NEWADMIN");
}

void TestEndToEndAffiliateSale() {
  auto  runtime = MakeRuntime();
  auto& market  = *runtime.service;

  const auto product_id = market.CreateProduct(CalledBy(kProducer), kProducer, Metadata(1000, 10, 2));
  assert(market.GetPrice(product_id) == 1000u);
  assert(market.GetCommission(product_id) == 10u);
  assert(market.GetType(product_id) == PRODUCT_TYPE_DIGITAL);
  assert(market.GetProducer(product_id) == kProducer);
  assert(market.GetDestination(product_id) == kProducer);
  assert(market.GetProduct(product_id)->uri() == "ipfs://product");

  const auto request_id = market.CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  assert(market.AcceptRequest(CalledBy(kProducer), request_id, kProducer) == request_id);
  assert(market.GetRequest(request_id)->status() == REQUEST_STATUS_ACCEPTED);

  assert(market.Deposit(kPurchaser, 1500) == 1500);

  Cart cart;
  *cart.add_items() = Item(request_id, true);
  const auto receipt = market.Purchase(CalledBy(kPurchaser), kPurchaser, kPublisher, cart);
  assert(receipt.shop() == kPublisher);

  assert(market.BalanceOf(market.GetFeeDestination()) == 10);
  assert(market.BalanceOf(kPublisher) == 1);
  assert(market.BalanceOf(kProducer) == 989);
  assert(market.BalanceOf(kPurchaser) == 500);
  assert(market.HoldingOf(product_id, kPurchaser) == 1);
  assert(market.HoldingOf(product_id, kProducer) == 1);
}

void TestFailuresSurfaceAsCodes() {
  auto  runtime = MakeRuntime();
  auto& market  = *runtime.service;

  assert(CodeOf([&] { market.CreateProduct(CalledBy(kProducer), kProducer, Metadata(0, 10)); }) == ERROR_CODE_VALIDATION);
  assert(CodeOf([&] { market.CreateRequest(CalledBy(kPublisher), 1, kPublisher); }) == ERROR_CODE_NOT_FOUND);

  const auto product_id = market.CreateProduct(CalledBy(kProducer), kProducer, Metadata(100, 10));
  const auto request_id = market.CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  assert(CodeOf([&] { market.CreateRequest(CalledBy(kPublisher), product_id, kPublisher); }) == ERROR_CODE_STATE_CONFLICT);
  assert(CodeOf([&] { market.AcceptRequest(CalledBy(kPublisher), request_id, kPublisher); }) == ERROR_CODE_UNAUTHORIZED);
  assert(CodeOf([&] { market.CancelRequest(CalledBy(kPublisher), 77, kPublisher); }) == ERROR_CODE_NOT_FOUND);

  Cart cart;
  *cart.add_items() = Item(request_id, true);
  assert(CodeOf([&] { market.Purchase(CalledBy(kPurchaser), kPurchaser, kPublisher, cart); }) == ERROR_CODE_STATE_CONFLICT);

  *cart.mutable_items(0) = Item(product_id, false);
  assert(CodeOf([&] { market.Purchase(CalledBy(kPurchaser), kPurchaser, kPublisher, cart); }) == ERROR_CODE_TRANSFER_REJECTED);

  assert(CodeOf([&] { market.RejectRequest(CalledBy(kProducer), request_id, kProducer); }) == ERROR_CODE_OK);
  assert(!market.GetRequest(request_id).has_value());
}

} // namespace

int main() {
  TestErrorCodeMapping();
  TestNonAdminSetAdminFailsWithUnauthorized();
  TestEndToEndAffiliateSale();
  TestFailuresSurfaceAsCodes();

  std::cout << "affiliate_market_unit_market_service: pass\n";
  return 0;
}
