#include <cassert>
#include <iostream>

#include "internal/model/principal.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/market_fixture.hpp"

namespace {

using market::model::CalledBy;
using market::testing::kProducer;
using market::testing::kPublisher;
using market::testing::MarketFixture;
using market::testing::Metadata;
using market::testing::Throws;
using market::util::AuthorizationError;
using market::util::NotFound;
using market::util::StateConflict;
using namespace market::protocol::v1;

uint64_t ListProduct(MarketFixture& fx) {
  return fx.catalog->CreateProduct(CalledBy(kProducer), kProducer, Metadata(1000, 10));
}

void TestStateMachineRules() {
  using market::model::CanTransition;
  using market::model::IsCancellable;
  static_assert(CanTransition(REQUEST_STATUS_PENDING, REQUEST_STATUS_ACCEPTED));
  static_assert(CanTransition(REQUEST_STATUS_ACCEPTED, REQUEST_STATUS_ACCEPTED));
  static_assert(!CanTransition(REQUEST_STATUS_ACCEPTED, REQUEST_STATUS_PENDING));
  static_assert(IsCancellable(REQUEST_STATUS_PENDING));
  static_assert(!IsCancellable(REQUEST_STATUS_ACCEPTED));
}

void TestCreateRequestStartsPending() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);

  const auto request_id = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  assert(request_id == 1);

  auto request = fx.lifecycle->GetRequest(request_id);
  assert(request.has_value());
  assert(request->product_id() == product_id);
  assert(request->publisher() == kPublisher);
  assert(request->status() == REQUEST_STATUS_PENDING);
}

void TestCreateRequestValidation() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);

  assert(Throws<AuthorizationError>([&] { fx.lifecycle->CreateRequest(CalledBy("ST2OTHER"), product_id, kPublisher); }));
  assert(Throws<NotFound>([&] { fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id + 7, kPublisher); }));

  fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  assert(Throws<StateConflict>([&] { fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher); }));

  // A different publisher may still ask for the same product.
  assert(fx.lifecycle->CreateRequest(CalledBy("ST2SECOND"), product_id, "ST2SECOND") == 2);
}

void TestCancelThenRequestAgain() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);

  const auto first = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  assert(fx.lifecycle->CancelRequest(CalledBy(kPublisher), first, kPublisher) == first);

  // The cancelled record is kept, only the membership is gone.
  assert(fx.lifecycle->GetRequest(first).has_value());

  const auto second = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  assert(second == 2);
}

void TestStaleCancelKeepsNewerRequest() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);

  const auto first = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  fx.lifecycle->CancelRequest(CalledBy(kPublisher), first, kPublisher);
  const auto second = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);

  // The old record no longer holds the pair, so it cannot release it.
  assert(Throws<StateConflict>([&] { fx.lifecycle->CancelRequest(CalledBy(kPublisher), first, kPublisher); }));
  assert(Throws<StateConflict>([&] { fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher); }));

  assert(fx.lifecycle->CancelRequest(CalledBy(kPublisher), second, kPublisher) == second);
  assert(Throws<StateConflict>([&] { fx.lifecycle->CancelRequest(CalledBy(kPublisher), second, kPublisher); }));
}

void TestCancelledRequestCannotBeAccepted() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);

  const auto first = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  fx.lifecycle->CancelRequest(CalledBy(kPublisher), first, kPublisher);

  assert(Throws<StateConflict>([&] { fx.lifecycle->AcceptRequest(CalledBy(kProducer), first, kProducer); }));
  assert(fx.lifecycle->GetRequest(first)->status() == REQUEST_STATUS_PENDING);

  const auto second = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  assert(Throws<StateConflict>([&] { fx.lifecycle->AcceptRequest(CalledBy(kProducer), first, kProducer); }));
  assert(fx.lifecycle->AcceptRequest(CalledBy(kProducer), second, kProducer) == second);
  assert(fx.lifecycle->GetRequest(second)->status() == REQUEST_STATUS_ACCEPTED);
}

void TestRejectingStaleRequestKeepsNewerMembership() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);

  const auto first = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  fx.lifecycle->CancelRequest(CalledBy(kPublisher), first, kPublisher);
  const auto second = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);

  assert(fx.lifecycle->RejectRequest(CalledBy(kProducer), first, kProducer) == first);
  assert(!fx.lifecycle->GetRequest(first).has_value());
  assert(fx.lifecycle->GetRequest(second).has_value());
  assert(Throws<StateConflict>([&] { fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher); }));
}

void TestCancelValidation() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);
  const auto    request_id = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);

  assert(Throws<NotFound>([&] { fx.lifecycle->CancelRequest(CalledBy(kPublisher), 99, kPublisher); }));
  assert(Throws<AuthorizationError>([&] { fx.lifecycle->CancelRequest(CalledBy("ST2OTHER"), request_id, kPublisher); }));
  assert(Throws<AuthorizationError>([&] { fx.lifecycle->CancelRequest(CalledBy("ST2OTHER"), request_id, "ST2OTHER"); }));

  fx.lifecycle->AcceptRequest(CalledBy(kProducer), request_id, kProducer);
  assert(Throws<StateConflict>([&] { fx.lifecycle->CancelRequest(CalledBy(kPublisher), request_id, kPublisher); }));
}

void TestAcceptRequest() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);
  const auto    request_id = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);

  assert(Throws<NotFound>([&] { fx.lifecycle->AcceptRequest(CalledBy(kProducer), 99, kProducer); }));
  assert(Throws<AuthorizationError>([&] { fx.lifecycle->AcceptRequest(CalledBy(kPublisher), request_id, kProducer); }));
  assert(Throws<AuthorizationError>([&] { fx.lifecycle->AcceptRequest(CalledBy("ST2OTHER"), request_id, "ST2OTHER"); }));
  assert(fx.lifecycle->GetRequest(request_id)->status() == REQUEST_STATUS_PENDING);

  assert(fx.lifecycle->AcceptRequest(CalledBy(kProducer), request_id, kProducer) == request_id);
  assert(fx.lifecycle->GetRequest(request_id)->status() == REQUEST_STATUS_ACCEPTED);

  // Accepting twice is harmless.
  assert(fx.lifecycle->AcceptRequest(CalledBy(kProducer), request_id, kProducer) == request_id);
  assert(fx.lifecycle->GetRequest(request_id)->status() == REQUEST_STATUS_ACCEPTED);
}

void TestRejectRemovesRecordAndMembership() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);
  const auto    request_id = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);

  assert(Throws<AuthorizationError>([&] { fx.lifecycle->RejectRequest(CalledBy(kPublisher), request_id, kProducer); }));
  assert(fx.lifecycle->RejectRequest(CalledBy(kProducer), request_id, kProducer) == request_id);
  assert(!fx.lifecycle->GetRequest(request_id).has_value());
  assert(Throws<NotFound>([&] { fx.lifecycle->RejectRequest(CalledBy(kProducer), request_id, kProducer); }));

  // The publisher may ask again and gets a fresh id.
  assert(fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher) == request_id + 1);
}

void TestRequestIdsAreNeverReused() {
  MarketFixture fx;
  const auto    product_id = ListProduct(fx);

  const auto first = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  fx.lifecycle->RejectRequest(CalledBy(kProducer), first, kProducer);
  const auto second = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);
  fx.lifecycle->CancelRequest(CalledBy(kPublisher), second, kPublisher);
  const auto third = fx.lifecycle->CreateRequest(CalledBy(kPublisher), product_id, kPublisher);

  assert(first < second && second < third);
}

} // namespace

int main() {
  TestStateMachineRules();
  TestCreateRequestStartsPending();
  TestCreateRequestValidation();
  TestCancelThenRequestAgain();
  TestStaleCancelKeepsNewerRequest();
  TestCancelledRequestCannotBeAccepted();
  TestRejectingStaleRequestKeepsNewerMembership();
  TestCancelValidation();
  TestAcceptRequest();
  TestRejectRemovesRecordAndMembership();
  TestRequestIdsAreNeverReused();

  std::cout << "affiliate_market_unit_request_lifecycle: pass\n";
  return 0;
}
