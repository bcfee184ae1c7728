#include "error_code.hpp"

#include "internal/util/errors.hpp"

namespace market::util {

market::protocol::v1::ErrorCode ToErrorCode(const std::exception& e) {
  if (const auto* error = dynamic_cast<const MarketError*>(&e)) {
    return error->code();
  }
  return market::protocol::v1::ERROR_CODE_INTERNAL;
}

} // namespace market::util
