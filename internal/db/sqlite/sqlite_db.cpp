#include "sqlite_db.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace routine::db::sqlite {

namespace {

void Check(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode, int busy_timeout_ms) : path_(std::move(path)) {
  constexpr int kFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int     rc     = sqlite3_open_v2(path_.c_str(), &db_, kFlags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open sqlite database " + path_ + ": " + reason);
  }

  try {
    Configure(wal_mode, busy_timeout_ms);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string reason = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw std::runtime_error("sqlite exec failed: " + reason);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  Check(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "sqlite prepare");
  return stmt;
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* stmt    = Prepare("PRAGMA user_version;");
  const int     rc      = sqlite3_step(stmt);
  const int     version = rc == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite user_version: ") + sqlite3_errmsg(db_));
  }
  return version;
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(bool wal_mode, int busy_timeout_ms) {
  Check(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "sqlite busy_timeout");
  Exec(wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");
  Exec("PRAGMA synchronous=NORMAL;");
}

} // namespace routine::db::sqlite
