#pragma once

#include <cstdint>
#include <string>

namespace casetrack::db::model {

namespace audit_kind {
inline constexpr const char* kTransition       = "TRANSITION";
inline constexpr const char* kCaseCreated      = "CASE_CREATED";
inline constexpr const char* kLockAcquired     = "LOCK_ACQUIRED";
inline constexpr const char* kLockReleased     = "LOCK_RELEASED";
inline constexpr const char* kLockAutoReleased = "LOCK_AUTO_RELEASED";
} // namespace audit_kind

/*
  Append-only audit row consumed by the history sink.

  Written in the same transaction as the change it describes.
*/
struct AuditEvent {
  std::string tenant_id;
  std::string entity_id;
  std::string kind;

  std::string from_state;
  std::string to_state;

  std::string actor;
  std::string annotation;

  uint64_t at_ms = 0;
};

} // namespace casetrack::db::model
