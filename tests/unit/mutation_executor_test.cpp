#include "internal/service/mutation_executor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using casetrack::breaker::BreakerOptions;
using casetrack::breaker::CircuitBreaker;
using casetrack::db::memory::MemoryRepository;
using casetrack::db::model::IdempotencyStatus;
using casetrack::idempotency::IdempotencyCoordinator;
using casetrack::service::MutationExecutor;
using casetrack::service::RequestMeta;
using casetrack::service::Response;
using casetrack::txn::TransactionContext;
using casetrack::txn::TransactionGuard;
using namespace std::chrono_literals;

const std::string kScope = "tenant-a:case:20251009";

struct FakeClock {
  std::shared_ptr<casetrack::util::TimePoint> now = std::make_shared<casetrack::util::TimePoint>(casetrack::util::FromUnixMillis(1'760'000'000'000));

  casetrack::util::ClockFn Fn() const {
    auto p = now;
    return [p] { return *p; };
  }

  void Advance(std::chrono::milliseconds d) {
    *now += d;
  }
};

// Fails audit appends on demand, the way a store outage surfaces mid-handler.
class HookedRepository : public MemoryRepository {
 public:
  casetrack::db::Result AppendAudit(casetrack::db::Transaction& tx, const casetrack::db::model::AuditEvent& event) override {
    if (fail_audit) {
      return casetrack::db::Result::Err(casetrack::db::ErrorCode::IOError, "disk unplugged");
    }
    return MemoryRepository::AppendAudit(tx, event);
  }

  std::atomic<bool> fail_audit{false};
};

struct Fixture {
  FakeClock                               clock;
  std::shared_ptr<HookedRepository>       repo        = std::make_shared<HookedRepository>();
  std::shared_ptr<TransactionGuard>       guard       = std::make_shared<TransactionGuard>(repo);
  std::shared_ptr<IdempotencyCoordinator> coordinator = std::make_shared<IdempotencyCoordinator>(repo, casetrack::idempotency::IdempotencyOptions{}, clock.Fn());
  MutationExecutor                        executor{coordinator, guard, clock.Fn()};

  int invocations = 0;

  // increments the counter and audits it; returns the new value as the body
  MutationExecutor::Handler CountingHandler() {
    return [this](TransactionContext& ctx) {
      ++invocations;
      auto&    tx    = guard->RequireActive(ctx, "count");
      uint64_t value = 0;
      casetrack::db::ThrowIfDbError(repo->IncrementCounter(tx, kScope, value), "increment");

      casetrack::db::model::AuditEvent event;
      event.tenant_id = "tenant-a";
      event.entity_id = "counter";
      event.kind      = "COUNTED";
      event.actor     = "alice";
      casetrack::db::ThrowIfDbError(repo->AppendAudit(tx, event), "audit");
      return Response{200, std::to_string(value)};
    };
  }

  std::optional<uint64_t> Counter() {
    auto tx    = repo->Begin();
    auto value = repo->GetCounter(*tx, kScope);
    tx->Rollback();
    return value;
  }

  std::optional<casetrack::db::model::IdempotencyRecord> Record(const std::string& key) {
    auto tx     = repo->Begin();
    auto record = repo->GetIdempotency(*tx, "tenant-a", "alice", key);
    tx->Rollback();
    return record;
  }
};

RequestMeta Meta(const std::string& key) {
  RequestMeta meta;
  meta.correlation_id  = "corr-1";
  meta.tenant_id       = "tenant-a";
  meta.actor           = "alice";
  meta.idempotency_key = key;
  meta.operation       = "counter.increment";
  meta.resource_path   = "/counters/case";
  meta.body            = R"({"by":1})";
  return meta;
}

void TestCommitThenReplay() {
  Fixture f;

  const auto first = f.executor.Run(Meta("key-1"), f.CountingHandler());
  assert(first.status_code == 200);
  assert(first.body == "1");
  assert(!first.replayed);
  assert(f.Record("key-1")->status == IdempotencyStatus::kCommitted);

  const auto second = f.executor.Run(Meta("key-1"), f.CountingHandler());
  assert(second.replayed);
  assert(second.body == "1");
  assert(f.invocations == 1);
  assert(f.Counter() == 1u);
}

void TestSameKeyDifferentPayloadConflicts() {
  Fixture f;

  f.executor.Run(Meta("key-1"), f.CountingHandler());

  auto changed = Meta("key-1");
  changed.body = R"({"by":2})";

  bool threw = false;
  try {
    f.executor.Run(changed, f.CountingHandler());
  } catch (const casetrack::util::FingerprintConflict&) {
    threw = true;
  }
  assert(threw);
  assert(f.invocations == 1);
}

void TestHandlerFailureRollsBackAndAllowsRetry() {
  Fixture f;

  bool threw = false;
  try {
    f.executor.Run(Meta("key-1"), [&](TransactionContext& ctx) -> Response {
      f.CountingHandler()(ctx);
      throw casetrack::util::MissingAnnotation("comment required");
    });
  } catch (const casetrack::util::MissingAnnotation&) {
    threw = true;
  }
  assert(threw);
  assert(!f.Counter().has_value());
  assert(f.Record("key-1")->status == IdempotencyStatus::kFailed);

  const auto retry = f.executor.Run(Meta("key-1"), f.CountingHandler());
  assert(!retry.replayed);
  assert(retry.body == "1");
}

void TestDeadlineExceededBeforeCommit() {
  Fixture f;

  auto meta    = Meta("key-1");
  meta.timeout = 5s;

  bool threw = false;
  try {
    f.executor.Run(meta, [&](TransactionContext& ctx) {
      auto response = f.CountingHandler()(ctx);
      f.clock.Advance(6s);
      return response;
    });
  } catch (const casetrack::util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);
  assert(!f.Counter().has_value());
  assert(f.Record("key-1")->status == IdempotencyStatus::kFailed);

  // within the deadline the same request commits
  auto quick    = Meta("key-1");
  quick.timeout = 5s;
  f.executor.Run(quick, f.CountingHandler());
  assert(f.Counter() == 1u);
}

void TestStoreFailureSurfacesAsStoreUnavailable() {
  Fixture f;
  f.repo->fail_audit = true;

  bool threw = false;
  try {
    f.executor.Run(Meta("key-1"), f.CountingHandler());
  } catch (const casetrack::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(!f.Counter().has_value());
  assert(f.Record("key-1")->status == IdempotencyStatus::kFailed);

  f.repo->fail_audit = false;
  f.executor.Run(Meta("key-1"), f.CountingHandler());
  assert(f.Counter() == 1u);
}

void TestSkippedTransactionIsNeverCachedAsCommitted() {
  Fixture f;

  auto meta             = Meta("key-1");
  meta.skip_transaction = true;

  const auto response = f.executor.Run(meta, f.CountingHandler());
  assert(response.body == "1");
  assert(!f.Counter().has_value());
  assert(f.Record("key-1")->status == IdempotencyStatus::kFailed);
}

void TestRequestsWithoutKeyAlwaysExecute() {
  Fixture f;

  f.executor.Run(Meta(""), f.CountingHandler());
  f.executor.Run(Meta(""), f.CountingHandler());
  assert(f.invocations == 2);
  assert(f.Counter() == 2u);
}

void TestOpenCircuitRefusesMutations() {
  Fixture f;
  auto    breakers = std::make_shared<CircuitBreaker>(std::make_shared<MemoryRepository>(),
                                                   BreakerOptions{.failure_threshold = 1, .cooldown = 30s}, f.clock.Fn());
  MutationExecutor gated(f.coordinator, f.guard, f.clock.Fn(), breakers);

  breakers->RecordFailure("document-store");

  bool refused = false;
  try {
    gated.Run(Meta("key-1"), f.CountingHandler());
  } catch (const casetrack::util::DependencyUnavailable& e) {
    refused = e.dependency() == "document-store";
  }
  assert(refused);
  assert(f.invocations == 0);
  assert(!f.Record("key-1").has_value());

  // reads are not gated
  auto read             = Meta("");
  read.skip_transaction = true;
  gated.Run(read, f.CountingHandler());
  assert(f.invocations == 1);

  // once the cooldown elapses the gate lifts so the trial call can happen
  f.clock.Advance(30s);
  const auto response = gated.Run(Meta("key-1"), f.CountingHandler());
  assert(response.body == "1");
  assert(f.Record("key-1")->status == IdempotencyStatus::kCommitted);
}

void TestMissingIdentityIsRejected() {
  Fixture f;

  auto meta      = Meta("key-1");
  meta.tenant_id = "";

  bool threw = false;
  try {
    f.executor.Run(meta, f.CountingHandler());
  } catch (const casetrack::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(f.invocations == 0);
}

} // namespace

int main() {
  TestCommitThenReplay();
  TestSameKeyDifferentPayloadConflicts();
  TestHandlerFailureRollsBackAndAllowsRetry();
  TestDeadlineExceededBeforeCommit();
  TestStoreFailureSurfacesAsStoreUnavailable();
  TestSkippedTransactionIsNeverCachedAsCommitted();
  TestRequestsWithoutKeyAlwaysExecute();
  TestOpenCircuitRefusesMutations();
  TestMissingIdentityIsRejected();

  std::cout << "casetrack_unit_mutation_executor: pass\n";
  return 0;
}
