#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace routine::db::sqlite {

/*
  Owns the single sqlite3 connection of a database file.

  Every transaction runs on this connection, serialized by
  TransactionMutex(). Schema setup lives in sqlite_schema.hpp.
*/
class SqliteDB {
 public:
  static constexpr int kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements; throws std::runtime_error on failure.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // PRAGMA user_version, the applied schema migration count.
  int  UserVersion();
  void SetUserVersion(int version);

  const std::string& Path() const {
    return path_;
  }

 private:
  void Configure(bool wal_mode, int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace routine::db::sqlite
