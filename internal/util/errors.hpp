#pragma once

#include <stdexcept>
#include <string>

#include "market/protocol/v1/types.pb.h"

namespace market::util {

// Base for every failure a marketplace operation reports to its caller.
// Anything else that escapes an operation is reported as ERROR_CODE_INTERNAL.
class MarketError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;

  virtual market::protocol::v1::ErrorCode code() const noexcept = 0;
};

template <market::protocol::v1::ErrorCode Code>
class CodedError : public MarketError {
 public:
  explicit CodedError(const std::string& msg) : MarketError(msg) {
  }

  market::protocol::v1::ErrorCode code() const noexcept override {
    return Code;
  }
};

// Caller is not the admin, the producer, the purchaser or the shop.
using AuthorizationError = CodedError<market::protocol::v1::ERROR_CODE_UNAUTHORIZED>;
using ValidationError    = CodedError<market::protocol::v1::ERROR_CODE_VALIDATION>;
using NotFound           = CodedError<market::protocol::v1::ERROR_CODE_NOT_FOUND>;
// Duplicate request, wrong request status, or a lost optimistic commit.
using StateConflict = CodedError<market::protocol::v1::ERROR_CODE_STATE_CONFLICT>;
// The asset ledger refused a fund or asset movement.
using TransferRejected = CodedError<market::protocol::v1::ERROR_CODE_TRANSFER_REJECTED>;

} // namespace market::util
