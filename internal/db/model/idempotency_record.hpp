#pragma once

#include <cstdint>
#include <string>

namespace casetrack::db::model {

enum class IdempotencyStatus : int {
  kPending   = 0,
  kCommitted = 1,
  kFailed    = 2,
};

/*
  Replay cache row, keyed by (tenant_id, actor, key).

  - At most one COMMITTED row per key.
  - FAILED rows are evictable and may be reclaimed by a retry.
  - cached_* are only meaningful once COMMITTED.
*/
struct IdempotencyRecord {
  std::string tenant_id;
  std::string actor;
  std::string key;

  std::string       fingerprint;
  IdempotencyStatus status = IdempotencyStatus::kPending;

  int         cached_status_code = 0;
  std::string cached_body;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;
};

} // namespace casetrack::db::model
