#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace lidar::db::sqlite {

/*
  Thin RAII wrapper around a shared sqlite3 connection.

  The connection is opened FULLMUTEX and shared by all workers; TxMutex()
  serializes transactions on it since sqlite has one transaction per
  connection.
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Creates tables and indexes if missing.
void BootstrapSchema(SqliteDB& db);

} // namespace lidar::db::sqlite
