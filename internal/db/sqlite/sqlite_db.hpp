#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace entitystore::db::sqlite {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Thin RAII wrapper around sqlite3*.

  Lock() serializes multi-statement sequences issued by the collections that
  share this connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  [[nodiscard]] std::unique_lock<std::recursive_mutex> Lock() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex mutex_;
};

} // namespace entitystore::db::sqlite
