#pragma once

#include <cstdint>
#include <string>

namespace casetrack::db::model {

/*
  Advisory editing lock. One row per (tenant_id, entity_id).

  Liveness is not stored: a lock is live while
  now - last_activity_at_ms < inactivity timeout.
*/
struct EntityLockRecord {
  std::string tenant_id;
  std::string entity_id;
  std::string holder;

  uint64_t acquired_at_ms      = 0;
  uint64_t last_activity_at_ms = 0;
};

} // namespace casetrack::db::model
