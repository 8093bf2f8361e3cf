#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_event.hpp"
#include "internal/db/model/breaker_record.hpp"
#include "internal/db/model/case_record.hpp"
#include "internal/db/model/entity_lock_record.hpp"
#include "internal/db/model/idempotency_record.hpp"

namespace casetrack::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes take a Transaction
  - Reads inside a transaction see its writes
  - IncrementCounter is a single atomic increment-and-read
  - Conditional writes (expected status / holder / version) report
    ErrorCode::Conflict instead of overwriting
  - Insert-if-absent writes report ErrorCode::AlreadyExists

  The store is the source of truth for:
    idempotency records
    sequence counters
    entity locks
    circuit breaker state
    case rows + audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Idempotency records
  // ---------------------------------------------------------------------

  virtual std::optional<model::IdempotencyRecord> GetIdempotency(Transaction&, const std::string& tenant_id, const std::string& actor,
                                                                 const std::string& key) = 0;

  virtual Result InsertIdempotency(Transaction&, const model::IdempotencyRecord&) = 0;

  // Replaces the row only while its stored status equals `expected`.
  virtual Result UpdateIdempotency(Transaction&, const model::IdempotencyRecord&, model::IdempotencyStatus expected) = 0;

  virtual Result PurgeExpiredIdempotency(Transaction&, uint64_t now_ms, uint64_t& purged) = 0;

  // ---------------------------------------------------------------------
  // Sequence counters
  // ---------------------------------------------------------------------

  // Creates the counter at 1 when absent, otherwise adds 1; returns the new value.
  virtual Result IncrementCounter(Transaction&, const std::string& scope_key, uint64_t& value) = 0;

  virtual std::optional<uint64_t> GetCounter(Transaction&, const std::string& scope_key) = 0;

  virtual Result InsertCounter(Transaction&, const std::string& scope_key, uint64_t value) = 0;

  // ---------------------------------------------------------------------
  // Entity locks
  // ---------------------------------------------------------------------

  // Backends with row locks lock the row for the rest of the transaction.
  virtual std::optional<model::EntityLockRecord> GetLock(Transaction&, const std::string& tenant_id, const std::string& entity_id) = 0;

  virtual Result InsertLock(Transaction&, const model::EntityLockRecord&) = 0;

  // Replaces the row only while the stored holder equals `expected_holder`.
  virtual Result ReplaceLock(Transaction&, const model::EntityLockRecord&, const std::string& expected_holder) = 0;

  virtual Result DeleteLock(Transaction&, const std::string& tenant_id, const std::string& entity_id, const std::string& expected_holder) = 0;

  // ---------------------------------------------------------------------
  // Circuit breakers
  // ---------------------------------------------------------------------

  virtual std::optional<model::BreakerRecord> GetBreaker(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::BreakerRecord> ListBreakers(Transaction&) = 0;

  // expected_version == 0 inserts (AlreadyExists if present); otherwise
  // replaces the row only while its stored version equals expected_version.
  virtual Result PutBreaker(Transaction&, const model::BreakerRecord&, uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Cases
  // ---------------------------------------------------------------------

  virtual Result InsertCase(Transaction&, const model::CaseRecord&) = 0;

  virtual std::optional<model::CaseRecord> GetCase(Transaction&, const std::string& tenant_id, const std::string& case_id) = 0;

  virtual std::vector<model::CaseRecord> ListCases(Transaction&, const std::string& tenant_id) = 0;

  // Writes `record` only while the stored version equals `expected_version`.
  virtual Result UpdateCase(Transaction&, const model::CaseRecord&, uint64_t expected_version) = 0;

  // All tenants: cases in `status` whose resume_at_ms is set and <= now_ms.
  virtual std::vector<model::CaseRecord> ListCasesDueForResume(Transaction&, const std::string& status, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Audit trail
  // ---------------------------------------------------------------------

  virtual Result AppendAudit(Transaction&, const model::AuditEvent&) = 0;

  // Insertion order.
  virtual std::vector<model::AuditEvent> ListAudit(Transaction&, const std::string& tenant_id, const std::string& entity_id) = 0;
};

} // namespace casetrack::db
