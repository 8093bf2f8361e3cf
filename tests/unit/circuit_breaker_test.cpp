#include "internal/breaker/circuit_breaker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using casetrack::breaker::BreakerOptions;
using casetrack::breaker::BreakerState;
using casetrack::breaker::CircuitBreaker;
using casetrack::db::memory::MemoryRepository;
using namespace std::chrono_literals;

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

// Refuses breaker writes on demand and counts the attempts.
class FlakyBreakerStore : public MemoryRepository {
 public:
  casetrack::db::Result PutBreaker(casetrack::db::Transaction& tx, const casetrack::db::model::BreakerRecord& record,
                                   uint64_t expected_version) override {
    if (fail_writes) {
      ++failed_writes;
      return casetrack::db::Result::Err(casetrack::db::ErrorCode::IOError, "store offline");
    }
    return MemoryRepository::PutBreaker(tx, record, expected_version);
  }

  bool fail_writes   = false;
  int  failed_writes = 0;
};

BreakerState StateOf(CircuitBreaker& breaker, const std::string& name) {
  for (const auto& record : breaker.Snapshot()) {
    if (record.name == name) return record.state;
  }
  return BreakerState::kClosed;
}

void TestOpensAfterThresholdFailures() {
  FakeClock      clock;
  CircuitBreaker breaker(std::make_shared<MemoryRepository>(), BreakerOptions{.failure_threshold = 3, .cooldown = 30s}, clock.Fn());

  assert(breaker.Allow("docs"));
  breaker.RecordFailure("docs");
  breaker.RecordFailure("docs");
  assert(StateOf(breaker, "docs") == BreakerState::kClosed);
  assert(breaker.Allow("docs"));

  breaker.RecordFailure("docs");
  assert(StateOf(breaker, "docs") == BreakerState::kOpen);
  assert(!breaker.Allow("docs"));
  assert(breaker.IsAnyOpen());
}

void TestHalfOpenAdmitsSingleTrialCall() {
  FakeClock      clock;
  CircuitBreaker breaker(std::make_shared<MemoryRepository>(), BreakerOptions{.failure_threshold = 1, .cooldown = 30s}, clock.Fn());

  breaker.RecordFailure("notify");
  assert(!breaker.Allow("notify"));

  clock.Advance(29s);
  assert(!breaker.Allow("notify"));

  clock.Advance(1s);
  assert(breaker.Allow("notify"));
  assert(StateOf(breaker, "notify") == BreakerState::kHalfOpen);

  // trial call still in flight
  assert(!breaker.Allow("notify"));

  breaker.RecordSuccess("notify");
  assert(StateOf(breaker, "notify") == BreakerState::kClosed);
  assert(breaker.Allow("notify"));
  assert(!breaker.IsAnyOpen());
}

void TestFailedTrialCallReopensAndRestartsCooldown() {
  FakeClock      clock;
  CircuitBreaker breaker(std::make_shared<MemoryRepository>(), BreakerOptions{.failure_threshold = 1, .cooldown = 10s}, clock.Fn());

  breaker.RecordFailure("docs");
  clock.Advance(10s);
  assert(breaker.Allow("docs"));

  breaker.RecordFailure("docs");
  assert(StateOf(breaker, "docs") == BreakerState::kOpen);

  clock.Advance(9s);
  assert(!breaker.Allow("docs"));
  clock.Advance(1s);
  assert(breaker.Allow("docs"));
}

void TestSuccessResetsFailureCount() {
  FakeClock      clock;
  CircuitBreaker breaker(std::make_shared<MemoryRepository>(), BreakerOptions{.failure_threshold = 2, .cooldown = 10s}, clock.Fn());

  breaker.RecordFailure("docs");
  breaker.RecordSuccess("docs");
  breaker.RecordFailure("docs");
  assert(StateOf(breaker, "docs") == BreakerState::kClosed);
}

void TestPerDependencyOptions() {
  FakeClock      clock;
  CircuitBreaker breaker(std::make_shared<MemoryRepository>(), BreakerOptions{.failure_threshold = 5, .cooldown = 10s}, clock.Fn());
  breaker.Configure("fragile", BreakerOptions{.failure_threshold = 1, .cooldown = 1s});

  breaker.RecordFailure("fragile");
  breaker.RecordFailure("sturdy");
  assert(StateOf(breaker, "fragile") == BreakerState::kOpen);
  assert(StateOf(breaker, "sturdy") == BreakerState::kClosed);
  assert(breaker.OptionsFor("sturdy").failure_threshold == 5);

  bool threw = false;
  try {
    breaker.Configure("broken", BreakerOptions{.failure_threshold = 0, .cooldown = 1s});
  } catch (const casetrack::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestCallShortCircuitsAndRecordsOutcome() {
  FakeClock      clock;
  CircuitBreaker breaker(std::make_shared<MemoryRepository>(), BreakerOptions{.failure_threshold = 1, .cooldown = 30s}, clock.Fn());

  assert(breaker.Call("docs", [] { return 7; }) == 7);

  bool failed = false;
  try {
    breaker.Call("docs", []() -> int { throw std::runtime_error("timeout"); });
  } catch (const std::runtime_error& e) {
    failed = std::string(e.what()) == "timeout";
  }
  assert(failed);

  bool short_circuited = false;
  bool invoked         = false;
  try {
    breaker.Call("docs", [&] { invoked = true; });
  } catch (const casetrack::util::DependencyUnavailable& e) {
    short_circuited = e.dependency() == "docs";
  }
  assert(short_circuited);
  assert(!invoked);
}

void TestLostTrialCallIsRearmedAfterCooldown() {
  FakeClock      clock;
  CircuitBreaker breaker(std::make_shared<MemoryRepository>(), BreakerOptions{.failure_threshold = 3, .cooldown = 30s}, clock.Fn());

  for (int i = 0; i < 3; ++i) breaker.RecordFailure("docs");
  clock.Advance(31s);

  // trial call granted, its caller never reports back
  assert(breaker.Allow("docs"));
  clock.Advance(29s);
  assert(!breaker.Allow("docs"));

  clock.Advance(1s);
  assert(breaker.Allow("docs"));
  assert(StateOf(breaker, "docs") == BreakerState::kHalfOpen);
  assert(!breaker.Allow("docs"));

  breaker.RecordSuccess("docs");
  assert(StateOf(breaker, "docs") == BreakerState::kClosed);

  // the same holds long after the fact
  for (int i = 0; i < 3; ++i) breaker.RecordFailure("docs");
  clock.Advance(31s);
  assert(breaker.Allow("docs"));
  clock.Advance(24h);
  assert(breaker.Allow("docs"));
}

void TestStoreFailureOnSuccessIsNotCountedAgainstDependency() {
  FakeClock      clock;
  auto           store = std::make_shared<FlakyBreakerStore>();
  CircuitBreaker breaker(store, BreakerOptions{.failure_threshold = 3, .cooldown = 30s}, clock.Fn());

  breaker.RecordFailure("docs");
  store->fail_writes = true;

  bool invoked = false;
  bool threw   = false;
  try {
    breaker.Call("docs", [&] { invoked = true; });
  } catch (const casetrack::util::StoreUnavailable&) {
    threw = true;
  }
  assert(invoked);
  assert(threw);
  // only the success write was attempted
  assert(store->failed_writes == 1);

  store->fail_writes = false;
  const auto records = breaker.Snapshot();
  assert(records.size() == 1);
  assert(records[0].failure_count == 1);
}

void TestStateIsSharedThroughTheStore() {
  FakeClock      clock;
  auto           store = std::make_shared<MemoryRepository>();
  CircuitBreaker first(store, BreakerOptions{.failure_threshold = 2, .cooldown = 30s}, clock.Fn());
  CircuitBreaker second(store, BreakerOptions{.failure_threshold = 2, .cooldown = 30s}, clock.Fn());

  first.RecordFailure("docs");
  second.RecordFailure("docs");
  assert(!first.Allow("docs"));
  assert(!second.Allow("docs"));
}

} // namespace

int main() {
  TestOpensAfterThresholdFailures();
  TestHalfOpenAdmitsSingleTrialCall();
  TestFailedTrialCallReopensAndRestartsCooldown();
  TestSuccessResetsFailureCount();
  TestPerDependencyOptions();
  TestCallShortCircuitsAndRecordsOutcome();
  TestLostTrialCallIsRearmedAfterCooldown();
  TestStoreFailureOnSuccessIsNotCountedAgainstDependency();
  TestStateIsSharedThroughTheStore();

  std::cout << "casetrack_unit_circuit_breaker: pass\n";
  return 0;
}
