#include "transaction.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace market::db {

void Transaction::Commit() {
  if (state_ != State::kOpen) {
    throw std::logic_error(state_ == State::kCommitted ? "transaction already committed" : "transaction already rolled back");
  }
  DoCommit();
  state_ = State::kCommitted;
}

void Transaction::Rollback() {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kRolledBack;
  DoRollback();
}

void Transaction::AbandonIfOpen() noexcept {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kRolledBack;
  try {
    DoRollback();
  } catch (const std::exception& e) {
    MARKET_LOG_WARN("transaction rollback failed", {market::observability::StringField("error", e.what())});
  }
}

} // namespace market::db
