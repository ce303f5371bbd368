#include "sqlite_schema.hpp"

#include <exception>
#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace routine::db::sqlite {

const std::vector<std::string>& SchemaMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: generic record table, routines are kind='routine'
      "CREATE TABLE IF NOT EXISTS memory_records ("
      "id TEXT PRIMARY KEY, kind TEXT NOT NULL, text TEXT NOT NULL, author TEXT NOT NULL, persona TEXT NOT NULL, "
      "importance INTEGER NOT NULL, metadata_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS memory_records_kind_idx ON memory_records (kind, created_at_ms);",
  };
  return kMigrations;
}

int ApplySchema(SqliteDB& db) {
  std::lock_guard<std::mutex> lock(db.TransactionMutex());

  const auto& migrations = SchemaMigrations();
  const int   current    = db.UserVersion();
  if (current > static_cast<int>(migrations.size())) {
    throw std::runtime_error("sqlite schema version " + std::to_string(current) + " is newer than this build supports");
  }

  for (int version = current + 1; version <= static_cast<int>(migrations.size()); ++version) {
    db.Exec("BEGIN IMMEDIATE;");
    try {
      db.Exec(migrations[version - 1]);
      db.SetUserVersion(version);
      db.Exec("COMMIT;");
    } catch (const std::exception& e) {
      db.Exec("ROLLBACK;");
      throw std::runtime_error("sqlite migration " + std::to_string(version) + " failed: " + e.what());
    }
    ROUTINE_LOG_INFO("Applied sqlite migration", {observability::IntField("version", version)});
  }

  return static_cast<int>(migrations.size());
}

} // namespace routine::db::sqlite
