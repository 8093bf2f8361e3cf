#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace casetrack::breaker {

using db::model::BreakerState;

const char* ToString(BreakerState state);

struct BreakerOptions {
  uint32_t                  failure_threshold = 3;
  std::chrono::milliseconds cooldown{std::chrono::seconds(30)};
};

/*
  CircuitBreaker

  Per-dependency breaker whose state lives in the backing store; every
  operation is one short store transaction with a version compare-and-swap,
  so processes sharing the store share one view of each dependency.

    CLOSED    --failures >= threshold-->  OPEN
    OPEN      --first Allow after cooldown-->  HALF_OPEN (one trial call)
    HALF_OPEN --success-->  CLOSED
    HALF_OPEN --failure-->  OPEN
    HALF_OPEN --trial call silent for a cooldown-->  HALF_OPEN (new trial call)

  The store handed to the breaker must accept a transaction while the
  calling request holds one (see factory for the per-backend choice).
*/
class CircuitBreaker {
 public:
  CircuitBreaker(std::shared_ptr<db::Repository> store, BreakerOptions defaults = {}, util::ClockFn clock = util::Now);

  void           Configure(const std::string& name, BreakerOptions options);
  BreakerOptions OptionsFor(const std::string& name) const;

  bool Allow(const std::string& name);
  void RecordSuccess(const std::string& name);
  void RecordFailure(const std::string& name);

  std::vector<db::model::BreakerRecord> Snapshot();
  // OPEN breakers still inside their cooldown. One whose cooldown has
  // elapsed is left out: its next Allow grants the recovery trial call.
  std::vector<std::string> OpenDependencies();
  bool                     IsAnyOpen();

  // Allow + fn + record outcome. Throws DependencyUnavailable when short-circuited.
  template <typename Fn>
  auto Call(const std::string& name, Fn&& fn) -> std::invoke_result_t<Fn>;

 private:
  // Runs `mutate` against the stored record (or a fresh CLOSED one) and
  // writes it back when it reports a change. Returns mutate's verdict.
  template <typename Mutate>
  bool Update(const std::string& name, Mutate&& mutate);

  void LogChange(const db::model::BreakerRecord& before, const db::model::BreakerRecord& after) const;

  std::shared_ptr<db::Repository> store_;
  BreakerOptions                  defaults_;
  util::ClockFn                   clock_;

  mutable std::mutex                    options_mutex_;
  std::map<std::string, BreakerOptions> options_;
};

template <typename Fn>
auto CircuitBreaker::Call(const std::string& name, Fn&& fn) -> std::invoke_result_t<Fn> {
  if (!Allow(name)) {
    throw util::DependencyUnavailable("dependency " + name + " is unavailable (circuit open)", name);
  }

  // only failures of fn count against the dependency, not of the breaker's own store
  if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
    try {
      std::forward<Fn>(fn)();
    } catch (const util::DependencyUnavailable&) {
      throw;
    } catch (const std::exception&) {
      RecordFailure(name);
      throw;
    }
    RecordSuccess(name);
  } else {
    std::optional<std::invoke_result_t<Fn>> result;
    try {
      result.emplace(std::forward<Fn>(fn)());
    } catch (const util::DependencyUnavailable&) {
      throw;
    } catch (const std::exception&) {
      RecordFailure(name);
      throw;
    }
    RecordSuccess(name);
    return std::move(*result);
  }
}

} // namespace casetrack::breaker
