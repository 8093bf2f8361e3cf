#pragma once

#include <cstdint>
#include <string>

namespace casetrack::db::model {

enum class BreakerState : int {
  kClosed   = 0,
  kOpen     = 1,
  kHalfOpen = 2,
};

/*
  Circuit breaker row, one per dependency name.

  version starts at 1 on insert and is bumped on every write; writers
  compare-and-swap on it so processes sharing a store see one breaker.
*/
struct BreakerRecord {
  std::string  name;
  BreakerState state = BreakerState::kClosed;

  uint32_t failure_count       = 0;
  uint64_t opened_at_ms        = 0;
  uint64_t last_failure_at_ms  = 0;
  bool     trial_in_flight     = false;
  uint64_t trial_started_at_ms = 0;

  uint64_t version = 0;
};

} // namespace casetrack::db::model
