#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/txn/transaction_guard.hpp"

namespace casetrack::sequence {

// (tenant, domain, day) where day is YYYYMMDD (UTC).
struct ScopeKey {
  std::string tenant_id;
  std::string domain;
  std::string day;

  std::string ToString() const;
};

/*
  SequenceCounter

  Issues strictly increasing values per scope via the store's atomic
  increment-and-read. The counter row is written in the caller's unit of
  work, so a rollback returns the drawn value and the next caller gets it.
  No value reaches two committed units of work.

  All calls run inside the caller's unit of work.
*/
class SequenceCounter {
 public:
  SequenceCounter(std::shared_ptr<db::Repository> repo, std::shared_ptr<txn::TransactionGuard> guard);

  uint64_t Next(txn::TransactionContext& ctx, const ScopeKey& scope);

  // Diagnostics only; does not increment.
  std::optional<uint64_t> Current(txn::TransactionContext& ctx, const ScopeKey& scope);

  // Migration only. Throws InvalidState if the counter already exists.
  void Initialize(txn::TransactionContext& ctx, const ScopeKey& scope, uint64_t start);

 private:
  static void Check(const ScopeKey& scope);

  std::shared_ptr<db::Repository>        repo_;
  std::shared_ptr<txn::TransactionGuard> guard_;
};

} // namespace casetrack::sequence
