#pragma once

#include <string>
#include <utility>

namespace market::model {

// Account identity (producer, publisher, purchaser, admin, payout accounts).
using Principal = std::string;

/*
  Identity of the party invoking an operation.

  Every public operation receives this explicitly; authorization checks
  compare the expected principal against `caller`.
*/
struct InvocationContext {
  Principal caller;
};

inline InvocationContext CalledBy(Principal caller) {
  return InvocationContext{std::move(caller)};
}

} // namespace market::model
