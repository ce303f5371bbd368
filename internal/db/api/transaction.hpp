#pragma once

namespace routine::db {

/*
  Unit of work over the record table.

  Writes made through a transaction are visible to reads through the same
  transaction only, until Commit(). Destroying an unfinished transaction
  rolls it back. Commit() or Rollback() after the transaction finished
  throws std::logic_error.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace routine::db
