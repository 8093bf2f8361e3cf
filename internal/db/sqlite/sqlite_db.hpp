#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace casetrack::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the process; transactions on it are
  serialized by tx_mutex_ (SqliteTransaction holds it for its lifetime).
  Other processes are serialized by BEGIN IMMEDIATE + busy_timeout.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace casetrack::db::sqlite
