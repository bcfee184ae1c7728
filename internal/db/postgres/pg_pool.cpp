#include "pg_pool.hpp"

#include <utility>

namespace market::db::postgres {

namespace {

struct PreparedStatement {
  const char* name;
  const char* sql;
};

constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS products (id BIGINT PRIMARY KEY, producer TEXT NOT NULL, price BIGINT NOT NULL CHECK (price >= 1),"
    " commission INTEGER NOT NULL CHECK (commission BETWEEN 0 AND 100), type SMALLINT NOT NULL, destination TEXT NOT NULL, uri TEXT)",
    "CREATE TABLE IF NOT EXISTS requests (id BIGINT PRIMARY KEY, product_id BIGINT NOT NULL, publisher TEXT NOT NULL, status SMALLINT NOT NULL)",
    "CREATE TABLE IF NOT EXISTS request_membership (product_id BIGINT NOT NULL, publisher TEXT NOT NULL, request_id BIGINT NOT NULL,"
    " PRIMARY KEY (product_id, publisher))",
    "CREATE TABLE IF NOT EXISTS singletons (name TEXT PRIMARY KEY, value TEXT NOT NULL)",
    "CREATE TABLE IF NOT EXISTS counters (name TEXT PRIMARY KEY, value BIGINT NOT NULL)",
    "CREATE TABLE IF NOT EXISTS balances (account TEXT PRIMARY KEY, amount BIGINT NOT NULL)",
    "CREATE TABLE IF NOT EXISTS holdings (product_id BIGINT NOT NULL, owner TEXT NOT NULL, amount BIGINT NOT NULL, PRIMARY KEY (product_id, owner))",
};

constexpr PreparedStatement kStatements[] = {
    {"insert_product", "INSERT INTO products(id,producer,price,commission,type,destination,uri) VALUES($1,$2,$3,$4,$5,$6,$7)"},
    {"get_product", "SELECT id,producer,price,commission,type,destination,uri FROM products WHERE id=$1"},

    {"insert_request", "INSERT INTO requests(id,product_id,publisher,status) VALUES($1,$2,$3,$4)"},
    {"get_request", "SELECT id,product_id,publisher,status FROM requests WHERE id=$1"},
    {"update_request", "UPDATE requests SET product_id=$2,publisher=$3,status=$4 WHERE id=$1"},
    {"delete_request", "DELETE FROM requests WHERE id=$1"},

    {"get_membership", "SELECT request_id FROM request_membership WHERE product_id=$1 AND publisher=$2"},
    {"insert_membership", "INSERT INTO request_membership(product_id,publisher,request_id) VALUES($1,$2,$3)"},
    {"delete_membership", "DELETE FROM request_membership WHERE product_id=$1 AND publisher=$2"},

    {"get_singleton", "SELECT value FROM singletons WHERE name=$1"},
    {"upsert_singleton", "INSERT INTO singletons(name,value) VALUES($1,$2) ON CONFLICT(name) DO UPDATE SET value=EXCLUDED.value"},
    {"advance_counter",
     "INSERT INTO counters(name,value) VALUES($1,1) ON CONFLICT(name) DO UPDATE SET value=counters.value+1 RETURNING value"},

    {"get_balance", "SELECT amount FROM balances WHERE account=$1"},
    {"upsert_balance", "INSERT INTO balances(account,amount) VALUES($1,$2) ON CONFLICT(account) DO UPDATE SET amount=EXCLUDED.amount"},
    {"get_holding", "SELECT amount FROM holdings WHERE product_id=$1 AND owner=$2"},
    {"upsert_holding",
     "INSERT INTO holdings(product_id,owner,amount) VALUES($1,$2,$3) ON CONFLICT(product_id,owner) DO UPDATE SET amount=EXCLUDED.amount"},
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections > 0 ? max_connections : 1) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !idle_.empty() || open_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  // Reserve the slot, then connect without holding the lock.
  ++open_;
  lock.unlock();
  try {
    return Lend(Connect());
  } catch (const std::exception&) {
    Forget();
    throw;
  }
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const char* ddl : kSchema) {
    tx.exec(ddl);
  }
  tx.commit();
}

std::unique_ptr<pqxx::connection> PgPool::Connect() const {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& statement : kStatements) {
    conn->prepare(statement.name, statement.sql);
  }
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* c) {
    if (auto self = pool.lock()) {
      self->Return(c);
    } else {
      delete c;
    }
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::scoped_lock lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

void PgPool::Forget() {
  {
    std::scoped_lock lock(mutex_);
    --open_;
  }
  returned_.notify_one();
}

} // namespace market::db::postgres
