#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace casetrack::db::postgres {

namespace {

constexpr const char* kCaseColumns =
    "tenant_id,case_id,title,status,version,resume_at_ms,parked_by,last_transition_actor,last_transition_at_ms,created_by,created_at_ms";

model::CaseRecord ReadCase(const pqxx::row& row) {
  model::CaseRecord r;
  r.tenant_id             = row[0].c_str();
  r.case_id               = row[1].c_str();
  r.title                 = row[2].c_str();
  r.status                = row[3].c_str();
  r.version               = row[4].as<uint64_t>();
  r.resume_at_ms          = row[5].as<uint64_t>();
  r.parked_by             = row[6].c_str();
  r.last_transition_actor = row[7].c_str();
  r.last_transition_at_ms = row[8].as<uint64_t>();
  r.created_by            = row[9].c_str();
  r.created_at_ms         = row[10].as<uint64_t>();
  return r;
}

// Reads have no Result channel; surface driver failures as StoreUnavailable.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

std::optional<model::IdempotencyRecord> PgRepository::GetIdempotency(Transaction& t, const std::string& tenant_id, const std::string& actor,
                                                                     const std::string& key) {
  return Read([&]() -> std::optional<model::IdempotencyRecord> {
    auto res = TX(t).Work().exec_prepared("get_idempotency", tenant_id, actor, key);
    if (res.empty()) return std::nullopt;

    model::IdempotencyRecord r;
    r.tenant_id          = res[0][0].c_str();
    r.actor              = res[0][1].c_str();
    r.key                = res[0][2].c_str();
    r.fingerprint        = res[0][3].c_str();
    r.status             = static_cast<model::IdempotencyStatus>(res[0][4].as<int>());
    r.cached_status_code = res[0][5].as<int>();
    r.cached_body        = res[0][6].c_str();
    r.created_at_ms      = res[0][7].as<uint64_t>();
    r.expires_at_ms      = res[0][8].as<uint64_t>();
    return r;
  });
}

Result PgRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_idempotency", r.tenant_id, r.actor, r.key, r.fingerprint, static_cast<int>(r.status),
                                          r.cached_status_code, r.cached_body, r.created_at_ms, r.expires_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateIdempotency(Transaction& t, const model::IdempotencyRecord& r, model::IdempotencyStatus expected) {
  try {
    auto res = TX(t).Work().exec_prepared("update_idempotency", r.tenant_id, r.actor, r.key, r.fingerprint, static_cast<int>(r.status),
                                          r.cached_status_code, r.cached_body, r.created_at_ms, r.expires_at_ms, static_cast<int>(expected));
    if (res.affected_rows() == 0) {
      return GetIdempotency(t, r.tenant_id, r.actor, r.key) ? Result::Err(ErrorCode::Conflict, "idempotency record status changed")
                                                            : Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::PurgeExpiredIdempotency(Transaction& t, uint64_t now_ms, uint64_t& purged) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM idempotency_records WHERE expires_at_ms<=$1;", now_ms);
    purged   = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result PgRepository::IncrementCounter(Transaction& t, const std::string& scope_key, uint64_t& value) {
  try {
    auto res = TX(t).Work().exec_prepared("increment_counter", scope_key);
    value    = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<uint64_t> PgRepository::GetCounter(Transaction& t, const std::string& scope_key) {
  return Read([&]() -> std::optional<uint64_t> {
    auto res = TX(t).Work().exec_params("SELECT value FROM sequence_counters WHERE scope_key=$1;", scope_key);
    if (res.empty()) return std::nullopt;
    return res[0][0].as<uint64_t>();
  });
}

Result PgRepository::InsertCounter(Transaction& t, const std::string& scope_key, uint64_t value) {
  try {
    auto res = TX(t).Work().exec_params("INSERT INTO sequence_counters(scope_key,value) VALUES($1,$2) ON CONFLICT DO NOTHING;", scope_key, value);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

std::optional<model::EntityLockRecord> PgRepository::GetLock(Transaction& t, const std::string& tenant_id, const std::string& entity_id) {
  return Read([&]() -> std::optional<model::EntityLockRecord> {
    auto res = TX(t).Work().exec_prepared("get_lock", tenant_id, entity_id);
    if (res.empty()) return std::nullopt;

    model::EntityLockRecord r;
    r.tenant_id           = res[0][0].c_str();
    r.entity_id           = res[0][1].c_str();
    r.holder              = res[0][2].c_str();
    r.acquired_at_ms      = res[0][3].as<uint64_t>();
    r.last_activity_at_ms = res[0][4].as<uint64_t>();
    return r;
  });
}

Result PgRepository::InsertLock(Transaction& t, const model::EntityLockRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO entity_locks(tenant_id,entity_id,holder,acquired_at_ms,last_activity_at_ms) VALUES($1,$2,$3,$4,$5) ON CONFLICT DO NOTHING;",
        r.tenant_id, r.entity_id, r.holder, r.acquired_at_ms, r.last_activity_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReplaceLock(Transaction& t, const model::EntityLockRecord& r, const std::string& expected_holder) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE entity_locks SET holder=$3,acquired_at_ms=$4,last_activity_at_ms=$5 WHERE tenant_id=$1 AND entity_id=$2 AND holder=$6;",
        r.tenant_id, r.entity_id, r.holder, r.acquired_at_ms, r.last_activity_at_ms, expected_holder);
    if (res.affected_rows() == 0) {
      return GetLock(t, r.tenant_id, r.entity_id) ? Result::Err(ErrorCode::Conflict, "lock holder changed") : Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteLock(Transaction& t, const std::string& tenant_id, const std::string& entity_id, const std::string& expected_holder) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM entity_locks WHERE tenant_id=$1 AND entity_id=$2 AND holder=$3;", tenant_id, entity_id,
                                        expected_holder);
    if (res.affected_rows() == 0) {
      return GetLock(t, tenant_id, entity_id) ? Result::Err(ErrorCode::Conflict, "lock holder changed") : Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Circuit breakers
// ------------------------------------------------------------------

static model::BreakerRecord ReadBreaker(const pqxx::row& row) {
  model::BreakerRecord r;
  r.name               = row[0].c_str();
  r.state              = static_cast<model::BreakerState>(row[1].as<int>());
  r.failure_count      = row[2].as<uint32_t>();
  r.opened_at_ms       = row[3].as<uint64_t>();
  r.last_failure_at_ms = row[4].as<uint64_t>();
  r.trial_in_flight     = row[5].as<bool>();
  r.trial_started_at_ms = row[6].as<uint64_t>();
  r.version             = row[7].as<uint64_t>();
  return r;
}

std::optional<model::BreakerRecord> PgRepository::GetBreaker(Transaction& t, const std::string& name) {
  return Read([&]() -> std::optional<model::BreakerRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT name,state,failure_count,opened_at_ms,last_failure_at_ms,trial_in_flight,trial_started_at_ms,version FROM circuit_breakers WHERE name=$1 FOR UPDATE;",
        name);
    if (res.empty()) return std::nullopt;
    return ReadBreaker(res[0]);
  });
}

std::vector<model::BreakerRecord> PgRepository::ListBreakers(Transaction& t) {
  return Read([&] {
    auto res = TX(t).Work().exec(
        "SELECT name,state,failure_count,opened_at_ms,last_failure_at_ms,trial_in_flight,trial_started_at_ms,version FROM circuit_breakers ORDER BY name;");

    std::vector<model::BreakerRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadBreaker(row));
    return out;
  });
}

Result PgRepository::PutBreaker(Transaction& t, const model::BreakerRecord& r, uint64_t expected_version) {
  try {
    if (expected_version == 0) {
      auto res = TX(t).Work().exec_params(
          "INSERT INTO circuit_breakers(name,state,failure_count,opened_at_ms,last_failure_at_ms,trial_in_flight,trial_started_at_ms,version) "
          "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT DO NOTHING;",
          r.name, static_cast<int>(r.state), r.failure_count, r.opened_at_ms, r.last_failure_at_ms, r.trial_in_flight, r.trial_started_at_ms,
          r.version);
      if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
      return Result::Ok();
    }

    auto res = TX(t).Work().exec_params(
        "UPDATE circuit_breakers SET state=$2,failure_count=$3,opened_at_ms=$4,last_failure_at_ms=$5,trial_in_flight=$6,trial_started_at_ms=$7,"
        "version=$8 WHERE name=$1 AND version=$9;",
        r.name, static_cast<int>(r.state), r.failure_count, r.opened_at_ms, r.last_failure_at_ms, r.trial_in_flight, r.trial_started_at_ms, r.version,
        expected_version);
    if (res.affected_rows() == 0) {
      return GetBreaker(t, r.name) ? Result::Err(ErrorCode::Conflict, "breaker version changed") : Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Cases
// ------------------------------------------------------------------

Result PgRepository::InsertCase(Transaction& t, const model::CaseRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO cases(tenant_id,case_id,title,status,version,resume_at_ms,parked_by,last_transition_actor,last_transition_at_ms,created_by,"
        "created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) ON CONFLICT DO NOTHING;",
        r.tenant_id, r.case_id, r.title, r.status, r.version, r.resume_at_ms, r.parked_by, r.last_transition_actor, r.last_transition_at_ms,
        r.created_by, r.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CaseRecord> PgRepository::GetCase(Transaction& t, const std::string& tenant_id, const std::string& case_id) {
  return Read([&]() -> std::optional<model::CaseRecord> {
    auto res = TX(t).Work().exec_prepared("get_case", tenant_id, case_id);
    if (res.empty()) return std::nullopt;
    return ReadCase(res[0]);
  });
}

std::vector<model::CaseRecord> PgRepository::ListCases(Transaction& t, const std::string& tenant_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kCaseColumns + " FROM cases WHERE tenant_id=$1 ORDER BY case_id;", tenant_id);

    std::vector<model::CaseRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadCase(row));
    return out;
  });
}

Result PgRepository::UpdateCase(Transaction& t, const model::CaseRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_case", r.tenant_id, r.case_id, r.title, r.status, r.version, r.resume_at_ms, r.parked_by,
                                          r.last_transition_actor, r.last_transition_at_ms, expected_version);
    if (res.affected_rows() == 0) {
      return GetCase(t, r.tenant_id, r.case_id) ? Result::Err(ErrorCode::Conflict, "case version changed") : Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CaseRecord> PgRepository::ListCasesDueForResume(Transaction& t, const std::string& status, uint64_t now_ms) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(
        std::string("SELECT ") + kCaseColumns + " FROM cases WHERE status=$1 AND resume_at_ms>0 AND resume_at_ms<=$2 ORDER BY resume_at_ms;", status,
        now_ms);

    std::vector<model::CaseRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadCase(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::AppendAudit(Transaction& t, const model::AuditEvent& e) {
  try {
    TX(t).Work().exec_prepared("append_audit", e.tenant_id, e.entity_id, e.kind, e.from_state, e.to_state, e.actor, e.annotation, e.at_ms);
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

std::vector<model::AuditEvent> PgRepository::ListAudit(Transaction& t, const std::string& tenant_id, const std::string& entity_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT tenant_id,entity_id,kind,from_state,to_state,actor,annotation,at_ms FROM audit_events WHERE tenant_id=$1 AND entity_id=$2 "
        "ORDER BY seq;",
        tenant_id, entity_id);

    std::vector<model::AuditEvent> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::AuditEvent e;
      e.tenant_id  = row[0].c_str();
      e.entity_id  = row[1].c_str();
      e.kind       = row[2].c_str();
      e.from_state = row[3].c_str();
      e.to_state   = row[4].c_str();
      e.actor      = row[5].c_str();
      e.annotation = row[6].c_str();
      e.at_ms      = row[7].as<uint64_t>();
      out.push_back(std::move(e));
    }
    return out;
  });
}

} // namespace casetrack::db::postgres
