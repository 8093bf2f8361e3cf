#include "internal/lock/entity_lock_manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using casetrack::db::memory::MemoryRepository;
using casetrack::lock::AcquireOutcome;
using casetrack::lock::EntityLockManager;
using casetrack::lock::LockOptions;
using casetrack::txn::TransactionContext;
using casetrack::txn::TransactionGuard;
using namespace std::chrono_literals;
namespace audit_kind = casetrack::db::model::audit_kind;

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

struct Fixture {
  FakeClock                         clock;
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<TransactionGuard> guard = std::make_shared<TransactionGuard>(repo);
  EntityLockManager                 locks{repo, guard, LockOptions{.inactivity_timeout = 2h}, clock.Fn()};

  template <typename Fn>
  auto InTx(Fn&& fn) {
    TransactionContext ctx;
    return guard->Execute(ctx, [&](casetrack::db::Transaction&) { return fn(ctx); });
  }

  std::vector<casetrack::db::model::AuditEvent> Audit(const std::string& entity) {
    TransactionContext ctx;
    ctx.skipped = true;
    return guard->Execute(ctx, [&](casetrack::db::Transaction& tx) { return repo->ListAudit(tx, "tenant-a", entity); });
  }
};

void TestGrantAndRefresh() {
  Fixture f;

  auto first = f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });
  assert(first.outcome == AcquireOutcome::kGranted);
  assert(first.lock.holder == "alice");

  f.clock.Advance(10min);
  auto again = f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });
  assert(again.outcome == AcquireOutcome::kRefreshed);
  assert(again.lock.acquired_at_ms == first.lock.acquired_at_ms);
  assert(again.lock.last_activity_at_ms == first.lock.last_activity_at_ms + 10 * 60 * 1000);

  const auto events = f.Audit("CASE-1");
  assert(events.size() == 1);
  assert(events[0].kind == audit_kind::kLockAcquired);
}

void TestLiveLockConflictsForOtherUser() {
  Fixture f;

  f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });
  f.clock.Advance(10min);

  bool threw = false;
  try {
    f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "bob"); });
  } catch (const casetrack::util::LockConflict& e) {
    threw = e.holder() == "alice" && e.last_activity_at_ms() == e.acquired_at_ms();
  }
  assert(threw);
}

void TestInactivityBoundary() {
  Fixture f;

  f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });

  // one millisecond short of the timeout the lock is still live
  f.clock.Advance(2h - 1ms);
  bool threw = false;
  try {
    f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "bob"); });
  } catch (const casetrack::util::LockConflict&) {
    threw = true;
  }
  assert(threw);

  // exactly at the timeout it has lapsed
  f.clock.Advance(1ms);
  auto taken = f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "bob"); });
  assert(taken.outcome == AcquireOutcome::kTakenOver);
  assert(taken.previous_holder && *taken.previous_holder == "alice");
  assert(taken.lock.holder == "bob");

  const auto events = f.Audit("CASE-1");
  assert(events.size() == 3);
  assert(events[1].kind == audit_kind::kLockAutoReleased);
  assert(events[1].actor == casetrack::lock::kSystemActor);
  assert(events[1].annotation.find("alice") != std::string::npos);
  assert(events[1].annotation.find("2 hours") != std::string::npos);
  assert(events[2].kind == audit_kind::kLockAcquired);
  assert(events[2].actor == "bob");
}

void TestOwnLapsedLockIsReacquired() {
  Fixture f;

  auto first = f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });
  f.clock.Advance(3h);
  auto again = f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });
  assert(again.outcome == AcquireOutcome::kGranted);
  assert(again.lock.acquired_at_ms > first.lock.acquired_at_ms);
  assert(f.Audit("CASE-1").size() == 2);
}

void TestHeartbeatExtendsLock() {
  Fixture f;

  f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });
  f.clock.Advance(90min);
  f.InTx([&](TransactionContext& ctx) { return f.locks.Heartbeat(ctx, "tenant-a", "CASE-1", "alice"); });
  f.clock.Advance(90min);

  bool threw = false;
  try {
    f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "bob"); });
  } catch (const casetrack::util::LockConflict&) {
    threw = true;
  }
  assert(threw);

  bool forbidden = false;
  try {
    f.InTx([&](TransactionContext& ctx) { return f.locks.Heartbeat(ctx, "tenant-a", "CASE-1", "bob"); });
  } catch (const casetrack::util::Forbidden&) {
    forbidden = true;
  }
  assert(forbidden);
}

void TestHeartbeatOnLapsedLockIsForbidden() {
  Fixture f;

  f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });
  f.clock.Advance(2h);

  bool forbidden = false;
  try {
    f.InTx([&](TransactionContext& ctx) { return f.locks.Heartbeat(ctx, "tenant-a", "CASE-1", "alice"); });
  } catch (const casetrack::util::Forbidden&) {
    forbidden = true;
  }
  assert(forbidden);
}

void TestReleaseRules() {
  Fixture f;

  bool missing = false;
  try {
    f.InTx([&](TransactionContext& ctx) { f.locks.Release(ctx, "tenant-a", "CASE-1", "alice"); });
  } catch (const casetrack::util::Forbidden&) {
    missing = true;
  }
  assert(missing);

  f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });

  bool not_holder = false;
  try {
    f.InTx([&](TransactionContext& ctx) { f.locks.Release(ctx, "tenant-a", "CASE-1", "bob"); });
  } catch (const casetrack::util::Forbidden&) {
    not_holder = true;
  }
  assert(not_holder);

  f.InTx([&](TransactionContext& ctx) { f.locks.Release(ctx, "tenant-a", "CASE-1", "alice"); });

  auto view = f.InTx([&](TransactionContext& ctx) { return f.locks.Inspect(ctx, "tenant-a", "CASE-1"); });
  assert(!view.has_value());

  const auto events = f.Audit("CASE-1");
  assert(events.back().kind == audit_kind::kLockReleased);

  auto next = f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "bob"); });
  assert(next.outcome == AcquireOutcome::kGranted);
}

void TestEnsureNotLockedByOther() {
  Fixture f;

  f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice"); });

  f.InTx([&](TransactionContext& ctx) { f.locks.EnsureNotLockedByOther(ctx, "tenant-a", "CASE-1", "alice"); });
  f.InTx([&](TransactionContext& ctx) { f.locks.EnsureNotLockedByOther(ctx, "tenant-b", "CASE-1", "bob"); });

  bool threw = false;
  try {
    f.InTx([&](TransactionContext& ctx) { f.locks.EnsureNotLockedByOther(ctx, "tenant-a", "CASE-1", "bob"); });
  } catch (const casetrack::util::LockConflict&) {
    threw = true;
  }
  assert(threw);

  f.clock.Advance(2h);
  f.InTx([&](TransactionContext& ctx) { f.locks.EnsureNotLockedByOther(ctx, "tenant-a", "CASE-1", "bob"); });
}

void TestFailedUnitOfWorkLeavesNoLock() {
  Fixture f;

  bool threw = false;
  try {
    f.InTx([&](TransactionContext& ctx) {
      f.locks.Acquire(ctx, "tenant-a", "CASE-1", "alice");
      throw std::runtime_error("handler failed");
    });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto view = f.InTx([&](TransactionContext& ctx) { return f.locks.Inspect(ctx, "tenant-a", "CASE-1"); });
  assert(!view.has_value());
  assert(f.Audit("CASE-1").empty());
}

void TestConcurrentAcquireHasOneWinner() {
  Fixture f;

  constexpr int     kActors = 8;
  std::atomic<int>  granted{0};
  std::atomic<int>  conflicts{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < kActors; ++i) {
    threads.emplace_back([&, i] {
      try {
        f.InTx([&](TransactionContext& ctx) { return f.locks.Acquire(ctx, "tenant-a", "CASE-1", "user-" + std::to_string(i)); });
        ++granted;
      } catch (const casetrack::util::LockConflict&) {
        ++conflicts;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(granted == 1);
  assert(conflicts == kActors - 1);
}

} // namespace

int main() {
  TestGrantAndRefresh();
  TestLiveLockConflictsForOtherUser();
  TestInactivityBoundary();
  TestOwnLapsedLockIsReacquired();
  TestHeartbeatExtendsLock();
  TestHeartbeatOnLapsedLockIsForbidden();
  TestReleaseRules();
  TestEnsureNotLockedByOther();
  TestFailedUnitOfWorkLeavesNoLock();
  TestConcurrentAcquireHasOneWinner();

  std::cout << "casetrack_unit_entity_lock_manager: pass\n";
  return 0;
}
