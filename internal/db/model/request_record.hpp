#pragma once

#include <cstdint>
#include <string>

#include "market/protocol/v1/types.pb.h"

namespace market::db::model {

/*
  Persistent affiliate request row.

  Uniqueness of active (product_id, publisher) pairs is tracked separately
  by the membership table, which names the request holding each pair.
*/

struct RequestRecord {
  uint64_t id = 0;

  uint64_t product_id = 0;

  std::string publisher;

  market::protocol::v1::RequestStatus status = market::protocol::v1::REQUEST_STATUS_UNSPECIFIED;
};

} // namespace market::db::model
