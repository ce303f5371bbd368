#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace routine::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!lock_.owns_lock()) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    ROUTINE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  Finish("COMMIT;");
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

void SqliteTransaction::Finish(const char* statement) {
  if (!lock_.owns_lock()) {
    throw std::logic_error("sqlite transaction already finished");
  }
  db_->Exec(statement);
  lock_.unlock();
}

} // namespace routine::db::sqlite
