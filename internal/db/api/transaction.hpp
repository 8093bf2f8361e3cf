#pragma once

namespace casetrack::db {

/*
  Abstract store transaction (one unit of work).

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Write transactions on the same store are serializable

  SQLite:   BEGIN IMMEDIATE
  Postgres: pqxx::work (+ row locks / conditional statements)
  Memory:   store-wide writer lock + working copy
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
};

} // namespace casetrack::db
