#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace entitystore::db::sqlite {

/*
  SQLite transaction scope.

  Uses BEGIN IMMEDIATE to grab the write lock early. Rolls back on destruction
  unless committed.
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
};

} // namespace entitystore::db::sqlite
