#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace casetrack::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Write transactions are serialized by a store-wide writer lock held
  from Begin() until Commit()/Rollback(), which makes every
  read-modify-write inside a transaction atomic. Opening a second
  transaction on the same thread while one is open deadlocks.

  Not final: tests derive from it to inject store failures.
*/
class MemoryRepository : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::IdempotencyRecord> GetIdempotency(Transaction&, const std::string&, const std::string&, const std::string&) override;
  Result InsertIdempotency(Transaction&, const model::IdempotencyRecord&) override;
  Result UpdateIdempotency(Transaction&, const model::IdempotencyRecord&, model::IdempotencyStatus) override;
  Result PurgeExpiredIdempotency(Transaction&, uint64_t now_ms, uint64_t& purged) override;

  Result                  IncrementCounter(Transaction&, const std::string& scope_key, uint64_t& value) override;
  std::optional<uint64_t> GetCounter(Transaction&, const std::string& scope_key) override;
  Result                  InsertCounter(Transaction&, const std::string& scope_key, uint64_t value) override;

  std::optional<model::EntityLockRecord> GetLock(Transaction&, const std::string&, const std::string&) override;
  Result InsertLock(Transaction&, const model::EntityLockRecord&) override;
  Result ReplaceLock(Transaction&, const model::EntityLockRecord&, const std::string&) override;
  Result DeleteLock(Transaction&, const std::string&, const std::string&, const std::string&) override;

  std::optional<model::BreakerRecord> GetBreaker(Transaction&, const std::string& name) override;
  std::vector<model::BreakerRecord>   ListBreakers(Transaction&) override;
  Result                              PutBreaker(Transaction&, const model::BreakerRecord&, uint64_t expected_version) override;

  Result                            InsertCase(Transaction&, const model::CaseRecord&) override;
  std::optional<model::CaseRecord>  GetCase(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::CaseRecord>    ListCases(Transaction&, const std::string&) override;
  Result                            UpdateCase(Transaction&, const model::CaseRecord&, uint64_t) override;
  std::vector<model::CaseRecord>    ListCasesDueForResume(Transaction&, const std::string&, uint64_t) override;

  Result                          AppendAudit(Transaction&, const model::AuditEvent&) override;
  std::vector<model::AuditEvent>  ListAudit(Transaction&, const std::string&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::IdempotencyRecord> idempotency;
    std::unordered_map<std::string, uint64_t>                 counters;
    std::unordered_map<std::string, model::EntityLockRecord>  locks;
    std::map<std::string, model::BreakerRecord>               breakers;

    // ordered so listings are stable
    std::map<std::string, model::CaseRecord> cases;
    std::vector<model::AuditEvent>           audit;
  };

  std::mutex writer_mutex_;
  State      committed_;
};

} // namespace casetrack::db::memory
