#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"

namespace casetrack::txn {

/*
  Per-request unit of work.

  Owned by exactly one request and never shared across requests.
  Destroying a context with an open transaction rolls it back
  (db::Transaction destructor contract).

  skipped is an explicit opt-out set by upstream middleware for
  read-only handlers; it is never defaulted.
*/
struct TransactionContext {
  bool active    = false;
  bool committed = false;
  bool skipped   = false;

  std::unique_ptr<db::Transaction> tx;
};

} // namespace casetrack::txn
