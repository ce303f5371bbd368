#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace routine::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRecord(Transaction&, const model::MemoryRecord&) override;
  std::optional<model::MemoryRecord> GetRecord(Transaction&, const std::string&) override;
  std::vector<model::MemoryRecord> ListRecords(Transaction&, const std::string& kind) override;
  Result UpdateRecord(Transaction&, const model::MemoryRecord&) override;
  Result DeleteRecord(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
