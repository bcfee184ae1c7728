#pragma once

#include <cstdint>
#include <string>

#include "market/protocol/v1/types.pb.h"

namespace market::db::model {

/*
  Persistent product row.

  Written once by create_product; no update path exists.
*/

struct ProductRecord {
  uint64_t id = 0;

  std::string producer;

  uint64_t price = 0;

  // Percentage, 0-100.
  uint32_t commission = 0;

  market::protocol::v1::ProductType type = market::protocol::v1::PRODUCT_TYPE_UNSPECIFIED;

  std::string destination;

  std::string uri;
};

} // namespace market::db::model
