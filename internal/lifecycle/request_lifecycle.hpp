#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/model/principal.hpp"
#include "market/protocol/v1.hpp"

namespace market::lifecycle {

/*
  Affiliate request state machine.

  A publisher asks to promote a product; the product's producer accepts
  or rejects. At most one active request exists per (product, publisher).
*/

class RequestLifecycle {
 public:
  explicit RequestLifecycle(std::shared_ptr<db::Repository> repository);

  uint64_t CreateRequest(const model::InvocationContext& ctx, uint64_t product_id, const model::Principal& publisher);

  // Releases the pair. The record stays behind as Pending but can no longer
  // be cancelled or accepted.
  uint64_t CancelRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& publisher);

  uint64_t AcceptRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer);

  // Removes the record, and its membership when it still holds the pair.
  uint64_t RejectRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer);

  std::optional<market::protocol::v1::AffiliateRequest> GetRequest(uint64_t request_id);

  static market::protocol::v1::AffiliateRequest ToMessage(const db::model::RequestRecord& record);

 private:
  db::model::RequestRecord LoadRequest(db::Transaction& tx, uint64_t request_id);

  // Request must exist and the caller must be its product's producer.
  db::model::RequestRecord LoadForProducer(db::Transaction& tx, const model::InvocationContext& ctx, uint64_t request_id,
                                           const model::Principal& producer);

  // True when the record is the pair's current membership holder.
  bool IsActive(db::Transaction& tx, const db::model::RequestRecord& record);
  void RequireActive(db::Transaction& tx, const db::model::RequestRecord& record);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace market::lifecycle
