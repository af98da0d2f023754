#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace tams::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Errors are thrown as util::StorageFailure.
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

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // One connection carries one transaction at a time; held for its lifetime.
  std::unique_lock<std::mutex> LockForTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Owned prepared statement; finalized on destruction.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  // SQLITE_ROW, SQLITE_DONE or an error code
  int Step();

  // Step expecting a row or the end; throws util::StorageFailure otherwise.
  bool NextRow();

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace tams::db::sqlite
