#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace opentimeline::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of a repository, so
  transactions serialize on TxMutex().
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace opentimeline::db::sqlite
