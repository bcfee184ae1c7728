#pragma once

namespace market::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres prepares its own $n-parameter variants in PgPool.
*/

// schema

static constexpr const char* SCHEMA_STATEMENTS[] = {
    "CREATE TABLE IF NOT EXISTS products (id INTEGER PRIMARY KEY, producer TEXT NOT NULL, price INTEGER NOT NULL CHECK (price >= 1),"
    " commission INTEGER NOT NULL CHECK (commission BETWEEN 0 AND 100), type INTEGER NOT NULL, destination TEXT NOT NULL, uri TEXT);",
    "CREATE TABLE IF NOT EXISTS requests (id INTEGER PRIMARY KEY, product_id INTEGER NOT NULL, publisher TEXT NOT NULL, status INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS request_membership (product_id INTEGER NOT NULL, publisher TEXT NOT NULL, request_id INTEGER NOT NULL,"
    " PRIMARY KEY (product_id, publisher));",
    "CREATE TABLE IF NOT EXISTS singletons (name TEXT PRIMARY KEY, value TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS counters (name TEXT PRIMARY KEY, value INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS balances (account TEXT PRIMARY KEY, amount INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS holdings (product_id INTEGER NOT NULL, owner TEXT NOT NULL, amount INTEGER NOT NULL, PRIMARY KEY (product_id, owner));",
};

// products

static constexpr const char* INSERT_PRODUCT =
    "INSERT INTO products(id,producer,price,commission,type,destination,uri)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PRODUCT =
    "SELECT id,producer,price,commission,type,destination,uri"
    " FROM products WHERE id=?;";

// requests

static constexpr const char* INSERT_REQUEST =
    "INSERT INTO requests(id,product_id,publisher,status) VALUES(?,?,?,?);";

static constexpr const char* SELECT_REQUEST =
    "SELECT id,product_id,publisher,status FROM requests WHERE id=?;";

static constexpr const char* UPDATE_REQUEST =
    "UPDATE requests SET product_id=?,publisher=?,status=? WHERE id=?;";

static constexpr const char* DELETE_REQUEST =
    "DELETE FROM requests WHERE id=?;";

// membership

static constexpr const char* SELECT_MEMBERSHIP =
    "SELECT request_id FROM request_membership WHERE product_id=? AND publisher=?;";

static constexpr const char* INSERT_MEMBERSHIP =
    "INSERT INTO request_membership(product_id,publisher,request_id) VALUES(?,?,?);";

static constexpr const char* DELETE_MEMBERSHIP =
    "DELETE FROM request_membership WHERE product_id=? AND publisher=?;";

// singletons and counters

static constexpr const char* SELECT_SINGLETON =
    "SELECT value FROM singletons WHERE name=?;";

static constexpr const char* UPSERT_SINGLETON =
    "INSERT INTO singletons(name,value) VALUES(?,?)"
    " ON CONFLICT(name) DO UPDATE SET value=excluded.value;";

static constexpr const char* ADVANCE_COUNTER =
    "INSERT INTO counters(name,value) VALUES(?,1)"
    " ON CONFLICT(name) DO UPDATE SET value=value+1"
    " RETURNING value;";

// ledger

static constexpr const char* SELECT_BALANCE =
    "SELECT amount FROM balances WHERE account=?;";

static constexpr const char* UPSERT_BALANCE =
    "INSERT INTO balances(account,amount) VALUES(?,?)"
    " ON CONFLICT(account) DO UPDATE SET amount=excluded.amount;";

static constexpr const char* SELECT_HOLDING =
    "SELECT amount FROM holdings WHERE product_id=? AND owner=?;";

static constexpr const char* UPSERT_HOLDING =
    "INSERT INTO holdings(product_id,owner,amount) VALUES(?,?,?)"
    " ON CONFLICT(product_id,owner) DO UPDATE SET amount=excluded.amount;";

} // namespace market::db::sql
