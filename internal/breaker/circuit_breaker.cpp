#include "circuit_breaker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace casetrack::breaker {

using db::model::BreakerRecord;

namespace {
constexpr int kMaxAttempts = 5;
} // namespace

const char* ToString(BreakerState state) {
  switch (state) {
    case BreakerState::kClosed:
      return "CLOSED";
    case BreakerState::kOpen:
      return "OPEN";
    case BreakerState::kHalfOpen:
      return "HALF_OPEN";
  }
  return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(std::shared_ptr<db::Repository> store, BreakerOptions defaults, util::ClockFn clock)
    : store_(std::move(store)), defaults_(defaults), clock_(std::move(clock)) {
  if (defaults_.failure_threshold == 0) {
    throw util::InvalidArgument("breaker failure threshold must be at least 1");
  }
}

void CircuitBreaker::Configure(const std::string& name, BreakerOptions options) {
  if (options.failure_threshold == 0) {
    throw util::InvalidArgument("breaker failure threshold must be at least 1");
  }
  std::lock_guard lock(options_mutex_);
  options_[name] = options;
}

BreakerOptions CircuitBreaker::OptionsFor(const std::string& name) const {
  std::lock_guard lock(options_mutex_);
  auto            it = options_.find(name);
  return it == options_.end() ? defaults_ : it->second;
}

template <typename Mutate>
bool CircuitBreaker::Update(const std::string& name, Mutate&& mutate) {
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    auto tx     = store_->Begin();
    auto stored = store_->GetBreaker(*tx, name);

    BreakerRecord record;
    record.name = name;
    if (stored) record = *stored;

    const BreakerRecord before  = record;
    const bool          verdict = mutate(record);

    const bool changed = !stored || record.state != before.state || record.failure_count != before.failure_count ||
                         record.opened_at_ms != before.opened_at_ms || record.last_failure_at_ms != before.last_failure_at_ms ||
                         record.trial_in_flight != before.trial_in_flight || record.trial_started_at_ms != before.trial_started_at_ms;
    if (!changed) {
      tx->Rollback();
      return verdict;
    }

    const uint64_t expected_version = stored ? stored->version : 0;
    record.version                  = expected_version + 1;

    auto result = store_->PutBreaker(*tx, record, expected_version);
    if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::AlreadyExists) {
      continue; // another process moved the breaker; re-evaluate against its state
    }
    db::ThrowIfDbError(result, "update breaker " + name);
    tx->Commit();

    LogChange(before, record);
    return verdict;
  }
  throw util::ConcurrentModification("breaker " + name + " kept changing concurrently");
}

void CircuitBreaker::LogChange(const BreakerRecord& before, const BreakerRecord& after) const {
  if (before.state == after.state) {
    return;
  }
  observability::Metrics::Instance().RecordBreakerTransition(after.name, ToString(after.state));

  if (after.state == BreakerState::kOpen) {
    CASETRACK_LOG_WARN("circuit opened", {observability::StringField("dependency", after.name), observability::StringField("from", ToString(before.state)),
                                          observability::IntField("failures", after.failure_count)});
    return;
  }
  CASETRACK_LOG_INFO("circuit state changed", {observability::StringField("dependency", after.name),
                                               observability::StringField("from", ToString(before.state)),
                                               observability::StringField("to", ToString(after.state))});
}

bool CircuitBreaker::Allow(const std::string& name) {
  const auto options = OptionsFor(name);

  return Update(name, [&](BreakerRecord& r) {
    const uint64_t now_ms   = util::ToUnixMillis(clock_());
    const uint64_t cooldown = static_cast<uint64_t>(options.cooldown.count());

    switch (r.state) {
      case BreakerState::kClosed:
        return true;

      case BreakerState::kOpen:
        if (now_ms - r.opened_at_ms >= cooldown || now_ms < r.opened_at_ms) {
          r.state               = BreakerState::kHalfOpen;
          r.trial_in_flight     = true;
          r.trial_started_at_ms = now_ms;
          return true;
        }
        return false;

      case BreakerState::kHalfOpen:
        // a trial call that never reported back is presumed lost after one cooldown
        if (r.trial_in_flight && now_ms - r.trial_started_at_ms < cooldown && now_ms >= r.trial_started_at_ms) {
          return false;
        }
        if (r.trial_in_flight) {
          CASETRACK_LOG_WARN("circuit trial call lost, re-arming", {observability::StringField("dependency", r.name)});
        }
        r.trial_in_flight     = true;
        r.trial_started_at_ms = now_ms;
        return true;
    }
    return false;
  });
}

void CircuitBreaker::RecordSuccess(const std::string& name) {
  Update(name, [](BreakerRecord& r) {
    r.state              = BreakerState::kClosed;
    r.failure_count      = 0;
    r.opened_at_ms       = 0;
    r.last_failure_at_ms = 0;
    r.trial_in_flight     = false;
    r.trial_started_at_ms = 0;
    return true;
  });
}

void CircuitBreaker::RecordFailure(const std::string& name) {
  const auto options = OptionsFor(name);

  Update(name, [&](BreakerRecord& r) {
    const uint64_t now_ms = util::ToUnixMillis(clock_());

    r.failure_count += 1;
    r.last_failure_at_ms = now_ms;

    if (r.state == BreakerState::kHalfOpen) {
      // failed trial call
      r.state               = BreakerState::kOpen;
      r.opened_at_ms        = now_ms;
      r.trial_in_flight     = false;
      r.trial_started_at_ms = 0;
    } else if (r.state == BreakerState::kClosed && r.failure_count >= options.failure_threshold) {
      r.state        = BreakerState::kOpen;
      r.opened_at_ms = now_ms;
    }
    return true;
  });
}

std::vector<BreakerRecord> CircuitBreaker::Snapshot() {
  auto tx  = store_->Begin();
  auto all = store_->ListBreakers(*tx);
  tx->Rollback();
  return all;
}

std::vector<std::string> CircuitBreaker::OpenDependencies() {
  const uint64_t now_ms = util::ToUnixMillis(clock_());

  std::vector<std::string> open;
  for (const auto& record : Snapshot()) {
    if (record.state != BreakerState::kOpen) continue;
    const auto cooldown = static_cast<uint64_t>(OptionsFor(record.name).cooldown.count());
    if (now_ms >= record.opened_at_ms && now_ms - record.opened_at_ms >= cooldown) continue;
    open.push_back(record.name);
  }
  return open;
}

bool CircuitBreaker::IsAnyOpen() {
  return !OpenDependencies().empty();
}

} // namespace casetrack::breaker
