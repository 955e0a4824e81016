#pragma once

namespace chessdb::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A read transaction sees one consistent committed snapshot

  SQLite: BEGIN IMMEDIATE (write) / BEGIN DEFERRED (read)
  Memory: pinned snapshot, copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual bool IsReadOnly() const = 0;
};

}
