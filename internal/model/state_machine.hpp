#pragma once

#include "market/protocol/v1/types.pb.h"

namespace market::model {

/*
  Affiliate request lifecycle:

    PENDING --accept--> ACCEPTED
    PENDING --reject--> (record removed)

  Cancellation releases the (product, publisher) membership only. A Pending
  record whose membership is gone is dead: it cannot be cancelled again or
  accepted.
*/

constexpr bool IsTerminal(market::protocol::v1::RequestStatus status) {
  return status == market::protocol::v1::REQUEST_STATUS_ACCEPTED;
}

constexpr bool CanTransition(market::protocol::v1::RequestStatus from, market::protocol::v1::RequestStatus to) {
  using namespace market::protocol::v1;
  if (from == to) {
    return from == REQUEST_STATUS_ACCEPTED;
  }
  return from == REQUEST_STATUS_PENDING && to == REQUEST_STATUS_ACCEPTED;
}

constexpr bool IsCancellable(market::protocol::v1::RequestStatus status) {
  return status == market::protocol::v1::REQUEST_STATUS_PENDING;
}

} // namespace market::model
