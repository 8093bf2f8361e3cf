#include "sequence_counter.hpp"

#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace casetrack::sequence {

std::string ScopeKey::ToString() const {
  return tenant_id + ":" + domain + ":" + day;
}

SequenceCounter::SequenceCounter(std::shared_ptr<db::Repository> repo, std::shared_ptr<txn::TransactionGuard> guard)
    : repo_(std::move(repo)), guard_(std::move(guard)) {
}

void SequenceCounter::Check(const ScopeKey& scope) {
  if (scope.tenant_id.empty() || scope.domain.empty() || scope.day.empty()) {
    throw util::InvalidArgument("sequence scope requires tenant, domain and day");
  }
}

uint64_t SequenceCounter::Next(txn::TransactionContext& ctx, const ScopeKey& scope) {
  Check(scope);
  auto& tx = guard_->RequireActive(ctx, "sequence next");

  uint64_t value = 0;
  db::ThrowIfDbError(repo_->IncrementCounter(tx, scope.ToString(), value), "increment sequence " + scope.ToString());

  observability::Metrics::Instance().RecordSequenceAllocation(scope.domain);
  return value;
}

std::optional<uint64_t> SequenceCounter::Current(txn::TransactionContext& ctx, const ScopeKey& scope) {
  Check(scope);
  auto& tx = guard_->RequireActive(ctx, "sequence current");
  return repo_->GetCounter(tx, scope.ToString());
}

void SequenceCounter::Initialize(txn::TransactionContext& ctx, const ScopeKey& scope, uint64_t start) {
  Check(scope);
  auto& tx = guard_->RequireActive(ctx, "sequence initialize");

  auto result = repo_->InsertCounter(tx, scope.ToString(), start);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::InvalidState("sequence " + scope.ToString() + " already initialized");
  }
  db::ThrowIfDbError(result, "initialize sequence " + scope.ToString());
}

} // namespace casetrack::sequence
