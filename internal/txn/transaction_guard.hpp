#pragma once

#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "transaction_context.hpp"

namespace casetrack::txn {

/*
  TransactionGuard

  Enforces that mutating store access happens inside a unit of work.

    Begin         opens the unit of work (InvalidState if already open)
    Commit        commits, sets committed = true
    Abort         rolls back (errors, timeouts, cancellation)
    RequireActive throws NoActiveTransaction when no unit of work is open
    Execute       Begin (if needed) + fn + Commit, rollback on any exception

  Skipped contexts run fn against a transaction that is always rolled
  back, so committed stays false and nothing is replayed as committed.
*/
class TransactionGuard {
 public:
  explicit TransactionGuard(std::shared_ptr<db::Repository> repo);

  void Begin(TransactionContext& ctx);
  void Commit(TransactionContext& ctx);
  void Abort(TransactionContext& ctx);

  db::Transaction& RequireActive(TransactionContext& ctx, std::string_view operation) const;

  template <typename Fn>
  auto Execute(TransactionContext& ctx, Fn&& fn) -> std::invoke_result_t<Fn, db::Transaction&>;

 private:
  void OpenSkipped(TransactionContext& ctx);
  void CloseSkipped(TransactionContext& ctx);

  std::shared_ptr<db::Repository> repo_;
};

template <typename Fn>
auto TransactionGuard::Execute(TransactionContext& ctx, Fn&& fn) -> std::invoke_result_t<Fn, db::Transaction&> {
  using R = std::invoke_result_t<Fn, db::Transaction&>;

  if (ctx.skipped) {
    OpenSkipped(ctx);
    try {
      if constexpr (std::is_void_v<R>) {
        std::forward<Fn>(fn)(*ctx.tx);
        CloseSkipped(ctx);
        return;
      } else {
        R result = std::forward<Fn>(fn)(*ctx.tx);
        CloseSkipped(ctx);
        return result;
      }
    } catch (...) {
      CloseSkipped(ctx);
      throw;
    }
  }

  if (!ctx.active) {
    Begin(ctx);
  }

  try {
    if constexpr (std::is_void_v<R>) {
      std::forward<Fn>(fn)(*ctx.tx);
      Commit(ctx);
      return;
    } else {
      R result = std::forward<Fn>(fn)(*ctx.tx);
      Commit(ctx);
      return result;
    }
  } catch (...) {
    Abort(ctx);
    throw;
  }
}

} // namespace casetrack::txn
