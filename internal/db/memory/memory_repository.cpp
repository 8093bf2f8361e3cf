#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace casetrack::db::memory {

namespace {

std::string IdempotencyKey(const std::string& tenant_id, const std::string& actor, const std::string& key) {
  return tenant_id + "#" + actor + "#" + key;
}

std::string EntityKey(const std::string& tenant_id, const std::string& entity_id) {
  return tenant_id + "#" + entity_id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

std::optional<model::IdempotencyRecord> MemoryRepository::GetIdempotency(Transaction& t, const std::string& tenant_id, const std::string& actor,
                                                                         const std::string& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.idempotency.find(IdempotencyKey(tenant_id, actor, key));
  if (it == s.idempotency.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.idempotency.try_emplace(IdempotencyKey(r.tenant_id, r.actor, r.key), r).second) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateIdempotency(Transaction& t, const model::IdempotencyRecord& r, model::IdempotencyStatus expected) {
  auto& s  = TX(t).Mutable();
  auto  it = s.idempotency.find(IdempotencyKey(r.tenant_id, r.actor, r.key));
  if (it == s.idempotency.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "idempotency record status changed");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::PurgeExpiredIdempotency(Transaction& t, uint64_t now_ms, uint64_t& purged) {
  auto& s = TX(t).Mutable();
  purged  = std::erase_if(s.idempotency, [&](const auto& entry) { return entry.second.expires_at_ms <= now_ms; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result MemoryRepository::IncrementCounter(Transaction& t, const std::string& scope_key, uint64_t& value) {
  value = ++TX(t).Mutable().counters[scope_key];
  return Result::Ok();
}

std::optional<uint64_t> MemoryRepository::GetCounter(Transaction& t, const std::string& scope_key) {
  const auto& s  = TX(t).View();
  const auto  it = s.counters.find(scope_key);
  if (it == s.counters.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertCounter(Transaction& t, const std::string& scope_key, uint64_t value) {
  if (!TX(t).Mutable().counters.try_emplace(scope_key, value).second) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

std::optional<model::EntityLockRecord> MemoryRepository::GetLock(Transaction& t, const std::string& tenant_id, const std::string& entity_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.locks.find(EntityKey(tenant_id, entity_id));
  if (it == s.locks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertLock(Transaction& t, const model::EntityLockRecord& r) {
  if (!TX(t).Mutable().locks.try_emplace(EntityKey(r.tenant_id, r.entity_id), r).second) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  return Result::Ok();
}

Result MemoryRepository::ReplaceLock(Transaction& t, const model::EntityLockRecord& r, const std::string& expected_holder) {
  auto& s  = TX(t).Mutable();
  auto  it = s.locks.find(EntityKey(r.tenant_id, r.entity_id));
  if (it == s.locks.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.holder != expected_holder) return Result::Err(ErrorCode::Conflict, "lock holder changed");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteLock(Transaction& t, const std::string& tenant_id, const std::string& entity_id, const std::string& expected_holder) {
  auto& s  = TX(t).Mutable();
  auto  it = s.locks.find(EntityKey(tenant_id, entity_id));
  if (it == s.locks.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.holder != expected_holder) return Result::Err(ErrorCode::Conflict, "lock holder changed");
  s.locks.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Circuit breakers
// ------------------------------------------------------------------

std::optional<model::BreakerRecord> MemoryRepository::GetBreaker(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  const auto  it = s.breakers.find(name);
  if (it == s.breakers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BreakerRecord> MemoryRepository::ListBreakers(Transaction& t) {
  std::vector<model::BreakerRecord> out;
  for (const auto& [_, record] : TX(t).View().breakers) out.push_back(record);
  return out;
}

Result MemoryRepository::PutBreaker(Transaction& t, const model::BreakerRecord& r, uint64_t expected_version) {
  auto& s = TX(t).Mutable();
  if (expected_version == 0) {
    if (!s.breakers.try_emplace(r.name, r).second) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  }
  auto it = s.breakers.find(r.name);
  if (it == s.breakers.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "breaker version changed");
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Cases
// ------------------------------------------------------------------

Result MemoryRepository::InsertCase(Transaction& t, const model::CaseRecord& r) {
  if (!TX(t).Mutable().cases.try_emplace(EntityKey(r.tenant_id, r.case_id), r).second) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  return Result::Ok();
}

std::optional<model::CaseRecord> MemoryRepository::GetCase(Transaction& t, const std::string& tenant_id, const std::string& case_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.cases.find(EntityKey(tenant_id, case_id));
  if (it == s.cases.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CaseRecord> MemoryRepository::ListCases(Transaction& t, const std::string& tenant_id) {
  std::vector<model::CaseRecord> out;
  for (const auto& [_, record] : TX(t).View().cases)
    if (record.tenant_id == tenant_id) out.push_back(record);
  return out;
}

Result MemoryRepository::UpdateCase(Transaction& t, const model::CaseRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.cases.find(EntityKey(r.tenant_id, r.case_id));
  if (it == s.cases.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "case version changed");
  it->second = r;
  return Result::Ok();
}

std::vector<model::CaseRecord> MemoryRepository::ListCasesDueForResume(Transaction& t, const std::string& status, uint64_t now_ms) {
  std::vector<model::CaseRecord> out;
  for (const auto& [_, record] : TX(t).View().cases)
    if (record.status == status && record.resume_at_ms != 0 && record.resume_at_ms <= now_ms) out.push_back(record);
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::AppendAudit(Transaction& t, const model::AuditEvent& e) {
  TX(t).Mutable().audit.push_back(e);
  return Result::Ok();
}

std::vector<model::AuditEvent> MemoryRepository::ListAudit(Transaction& t, const std::string& tenant_id, const std::string& entity_id) {
  std::vector<model::AuditEvent> out;
  for (const auto& e : TX(t).View().audit)
    if (e.tenant_id == tenant_id && e.entity_id == entity_id) out.push_back(e);
  return out;
}

} // namespace casetrack::db::memory
