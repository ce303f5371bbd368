#pragma once

#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace routine::db::sqlite {

/*
  Ordered schema migrations for the record store.

  Migration N (1-based) is applied when PRAGMA user_version < N, inside
  one transaction together with the version bump. Never edit a shipped
  entry; append a new one.
*/
const std::vector<std::string>& SchemaMigrations();

// Returns the schema version after migrating.
int ApplySchema(SqliteDB& db);

} // namespace routine::db::sqlite
