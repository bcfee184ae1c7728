#pragma once

#include <sqlite3.h>

#include <string>

namespace market::db::sqlite {

struct SqliteOptions {
  std::string path;
  bool        wal_mode        = true;
  int         busy_timeout_ms = 5000;
};

// Owns one serialized-mode connection. Shared by the repository and every
// transaction it opens.
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const SqliteOptions& Options() const {
    return options_;
  }

  // Runs one or more statements that return no rows. Throws
  // std::runtime_error carrying the sqlite message.
  void Exec(const std::string& sql);

 private:
  void ApplyPragmas();

  SqliteOptions options_;
  sqlite3*      db_ = nullptr;
};

} // namespace market::db::sqlite
