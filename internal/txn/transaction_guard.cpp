#include "transaction_guard.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace casetrack::txn {

TransactionGuard::TransactionGuard(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

void TransactionGuard::Begin(TransactionContext& ctx) {
  if (ctx.active || ctx.tx) {
    throw util::InvalidState("unit of work already open");
  }
  if (ctx.skipped) {
    throw util::InvalidState("cannot open a unit of work on a skipped context");
  }

  ctx.tx        = repo_->Begin();
  ctx.active    = true;
  ctx.committed = false;
}

void TransactionGuard::Commit(TransactionContext& ctx) {
  if (!ctx.active || !ctx.tx) {
    throw util::NoActiveTransaction("commit without an open unit of work");
  }

  ctx.tx->Commit();
  ctx.committed = true;
  ctx.active    = false;
  ctx.tx.reset();
}

void TransactionGuard::Abort(TransactionContext& ctx) {
  if (!ctx.active || !ctx.tx) {
    return;
  }

  // mark closed first so a failing rollback never leaves the context "active"
  ctx.active    = false;
  ctx.committed = false;
  auto tx       = std::move(ctx.tx);

  try {
    tx->Rollback();
  } catch (const std::exception& e) {
    CASETRACK_LOG_ERROR("transaction rollback failed", {observability::StringField("error", e.what())});
    throw;
  }

  CASETRACK_LOG_INFO("transaction rolled back");
}

db::Transaction& TransactionGuard::RequireActive(TransactionContext& ctx, std::string_view operation) const {
  if ((ctx.active || ctx.skipped) && ctx.tx) {
    return *ctx.tx;
  }
  throw util::NoActiveTransaction(std::string(operation) + " requires an active unit of work");
}

void TransactionGuard::OpenSkipped(TransactionContext& ctx) {
  if (ctx.tx) {
    throw util::InvalidState("unit of work already open");
  }
  ctx.tx        = repo_->Begin();
  ctx.committed = false;
}

void TransactionGuard::CloseSkipped(TransactionContext& ctx) {
  auto tx = std::move(ctx.tx);
  if (tx) {
    tx->Rollback();
  }
}

} // namespace casetrack::txn
