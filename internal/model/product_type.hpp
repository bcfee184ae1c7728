#pragma once

#include <string_view>

#include "market/protocol/v1/types.pb.h"

namespace market::model {

constexpr bool IsValidProductType(market::protocol::v1::ProductType type) {
  using namespace market::protocol::v1;
  return type == PRODUCT_TYPE_DIGITAL || type == PRODUCT_TYPE_PRINT_ON_DEMAND || type == PRODUCT_TYPE_PHYSICAL;
}

constexpr std::string_view ToString(market::protocol::v1::ProductType type) {
  using namespace market::protocol::v1;
  switch (type) {
    case PRODUCT_TYPE_DIGITAL:
      return "digital";
    case PRODUCT_TYPE_PRINT_ON_DEMAND:
      return "print_on_demand";
    case PRODUCT_TYPE_PHYSICAL:
      return "physical";
    default:
      return "unspecified";
  }
}

} // namespace market::model
