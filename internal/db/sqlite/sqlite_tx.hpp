#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace routine::db::sqlite {

// BEGIN IMMEDIATE on the shared connection. The connection's transaction
// mutex is held from construction until the transaction finishes.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  void Finish(const char* statement);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
};

} // namespace routine::db::sqlite
