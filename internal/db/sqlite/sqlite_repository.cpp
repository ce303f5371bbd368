#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace routine::db::sqlite {

using routine::db::ErrorCode;
using routine::db::Result;

namespace {

constexpr const char* kRecordColumns =
    "id,kind,text,author,persona,importance,metadata_json,created_at_ms,updated_at_ms";

/*
  Finalizes the statement on every exit path.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }
  explicit operator bool() const { return st_ != nullptr; }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::MemoryRecord ReadRecord(sqlite3_stmt* st) {
  model::MemoryRecord r;
  r.id            = ColText(st, 0);
  r.kind          = ColText(st, 1);
  r.text          = ColText(st, 2);
  r.author        = ColText(st, 3);
  r.persona       = ColText(st, 4);
  r.importance    = ColI32(st, 5);
  r.metadata_json = ColText(st, 6);
  r.created_at_ms = ColU64(st, 7);
  r.updated_at_ms = ColU64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, const model::MemoryRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO memory_records(") + kRecordColumns + ") VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.kind);
  BindText(st.get(), 3, r.text);
  BindText(st.get(), 4, r.author);
  BindText(st.get(), 5, r.persona);
  BindI32(st.get(), 6, r.importance);
  BindText(st.get(), 7, r.metadata_json);
  BindU64(st.get(), 8, r.created_at_ms);
  BindU64(st.get(), 9, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "record " + r.id + " already exists");
  }
  return Translate(db, rc);
}

std::optional<model::MemoryRecord> SqliteRepository::GetRecord(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kRecordColumns + " FROM memory_records WHERE id=?;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));

  return ReadRecord(st.get());
}

std::vector<model::MemoryRecord> SqliteRepository::ListRecords(Transaction& t, const std::string& kind) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kRecordColumns + " FROM memory_records WHERE kind=? ORDER BY created_at_ms, id;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  BindText(st.get(), 1, kind);

  std::vector<model::MemoryRecord> out;
  int                              rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRecord(st.get()));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  return out;
}

Result SqliteRepository::UpdateRecord(Transaction& t, const model::MemoryRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE memory_records SET kind=?,text=?,author=?,persona=?,importance=?,metadata_json=?,"
               "created_at_ms=?,updated_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.kind);
  BindText(st.get(), 2, r.text);
  BindText(st.get(), 3, r.author);
  BindText(st.get(), 4, r.persona);
  BindI32(st.get(), 5, r.importance);
  BindText(st.get(), 6, r.metadata_json);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.updated_at_ms);
  BindText(st.get(), 9, r.id);

  int  rc     = sqlite3_step(st.get());
  auto result = Translate(db, rc);
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "record " + r.id + " not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteRecord(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM memory_records WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);

  int  rc     = sqlite3_step(st.get());
  auto result = Translate(db, rc);
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "record " + id + " not found");
  return Result::Ok();
}

} // namespace routine::db::sqlite
