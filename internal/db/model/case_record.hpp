#pragma once

#include <cstdint>
#include <string>

namespace casetrack::db::model {

/*
  Persistent case row.

  version is bumped on every write and used for optimistic
  concurrency: updates are conditional on the version that was read.
*/
struct CaseRecord {
  std::string tenant_id;
  std::string case_id; // CASE-YYYYMMDD-NNNNN
  std::string title;

  std::string status;
  uint64_t    version = 0;

  // parked cases only (0 = none)
  uint64_t    resume_at_ms = 0;
  std::string parked_by;

  std::string last_transition_actor;
  uint64_t    last_transition_at_ms = 0;

  std::string created_by;
  uint64_t    created_at_ms = 0;
};

} // namespace casetrack::db::model
