#pragma once

namespace carelog::db {

/*
  Abstract transaction.

  For every backend:

  - writes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - the destructor rolls back if neither was called
  - at most one transaction is open per repository at a time; Begin()
    blocks until the previous one ends

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy, swapped in on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() succeeded
  virtual bool IsCommitted() const = 0;
};

}
