#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace casetrack::db::postgres {

/*
  PostgreSQL backend.

  GetLock / GetIdempotency read with FOR UPDATE so the read-modify-write
  in the lock manager and idempotency coordinator holds the row until commit.
  Inserts use ON CONFLICT DO NOTHING and report AlreadyExists on zero rows,
  which keeps the surrounding transaction usable.
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::IdempotencyRecord> GetIdempotency(Transaction&, const std::string&, const std::string&, const std::string&) override;
  Result InsertIdempotency(Transaction&, const model::IdempotencyRecord&) override;
  Result UpdateIdempotency(Transaction&, const model::IdempotencyRecord&, model::IdempotencyStatus) override;
  Result PurgeExpiredIdempotency(Transaction&, uint64_t now_ms, uint64_t& purged) override;

  Result                  IncrementCounter(Transaction&, const std::string& scope_key, uint64_t& value) override;
  std::optional<uint64_t> GetCounter(Transaction&, const std::string& scope_key) override;
  Result                  InsertCounter(Transaction&, const std::string& scope_key, uint64_t value) override;

  std::optional<model::EntityLockRecord> GetLock(Transaction&, const std::string&, const std::string&) override;
  Result                                 InsertLock(Transaction&, const model::EntityLockRecord&) override;
  Result ReplaceLock(Transaction&, const model::EntityLockRecord&, const std::string& expected_holder) override;
  Result DeleteLock(Transaction&, const std::string&, const std::string&, const std::string& expected_holder) override;

  std::optional<model::BreakerRecord> GetBreaker(Transaction&, const std::string& name) override;
  std::vector<model::BreakerRecord>   ListBreakers(Transaction&) override;
  Result                              PutBreaker(Transaction&, const model::BreakerRecord&, uint64_t expected_version) override;

  Result                           InsertCase(Transaction&, const model::CaseRecord&) override;
  std::optional<model::CaseRecord> GetCase(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::CaseRecord>   ListCases(Transaction&, const std::string& tenant_id) override;
  Result                           UpdateCase(Transaction&, const model::CaseRecord&, uint64_t expected_version) override;
  std::vector<model::CaseRecord>   ListCasesDueForResume(Transaction&, const std::string& status, uint64_t now_ms) override;

  Result                         AppendAudit(Transaction&, const model::AuditEvent&) override;
  std::vector<model::AuditEvent> ListAudit(Transaction&, const std::string&, const std::string&) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace casetrack::db::postgres
