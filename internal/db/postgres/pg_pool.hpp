#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace market::db::postgres {

/*
  Bounded pool of libpqxx connections.

  A pqxx::connection is not thread-safe, so a connection belongs to exactly
  one PgTransaction at a time. Acquire() blocks once max_connections are
  checked out. Dropping the returned handle puts the connection back, or
  closes it if the pool is already gone.

  Every connection carries the prepared statements PgRepository executes.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections);

  std::shared_ptr<pqxx::connection> Acquire();

  void BootstrapSchema();

  std::size_t MaxConnections() const {
    return max_connections_;
  }

 private:
  std::unique_ptr<pqxx::connection> Connect() const;
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);
  void                              Forget();

  const std::string conninfo_;
  const std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

} // namespace market::db::postgres
