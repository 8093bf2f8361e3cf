#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace casetrack::db::sqlite {

namespace {

/*
  Owns one prepared statement. Reads throw StoreUnavailable on prepare
  failure; writes check ok() and translate the rc themselves.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }

  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }

  int prepare_rc() const {
    return rc_;
  }

  void RequireOk() const {
    if (!ok()) throw util::StoreUnavailable(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
  }

  void Text(int idx, const std::string& s) {
    sqlite3_bind_text(st_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
  }

  void U64(int idx, uint64_t v) {
    sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
  }

  void I32(int idx, int v) {
    sqlite3_bind_int(st_, idx, v);
  }

  int Step() {
    return sqlite3_step(st_);
  }

  // Step for reads: SQLITE_ROW -> true, SQLITE_DONE -> false, else throws.
  bool NextRow() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StoreUnavailable(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
  }

  std::string ColText(int col) const {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  uint64_t ColU64(int col) const {
    return static_cast<uint64_t>(sqlite3_column_int64(st_, col));
  }

  int ColI32(int col) const {
    return sqlite3_column_int(st_, col);
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

model::IdempotencyRecord ReadIdempotency(const Statement& st) {
  model::IdempotencyRecord r;
  r.tenant_id          = st.ColText(0);
  r.actor              = st.ColText(1);
  r.key                = st.ColText(2);
  r.fingerprint        = st.ColText(3);
  r.status             = static_cast<model::IdempotencyStatus>(st.ColI32(4));
  r.cached_status_code = st.ColI32(5);
  r.cached_body        = st.ColText(6);
  r.created_at_ms      = st.ColU64(7);
  r.expires_at_ms      = st.ColU64(8);
  return r;
}

constexpr const char* kCaseColumns =
    "tenant_id,case_id,title,status,version,resume_at_ms,parked_by,last_transition_actor,last_transition_at_ms,created_by,created_at_ms";

model::CaseRecord ReadCase(const Statement& st) {
  model::CaseRecord r;
  r.tenant_id             = st.ColText(0);
  r.case_id               = st.ColText(1);
  r.title                 = st.ColText(2);
  r.status                = st.ColText(3);
  r.version               = st.ColU64(4);
  r.resume_at_ms          = st.ColU64(5);
  r.parked_by             = st.ColText(6);
  r.last_transition_actor = st.ColText(7);
  r.last_transition_at_ms = st.ColU64(8);
  r.created_by            = st.ColText(9);
  r.created_at_ms         = st.ColU64(10);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

std::optional<model::IdempotencyRecord> SqliteRepository::GetIdempotency(Transaction& t, const std::string& tenant_id, const std::string& actor,
                                                                         const std::string& key) {
  Statement st(TX(t).Handle(),
               "SELECT tenant_id,actor,key,fingerprint,status,cached_status_code,cached_body,created_at_ms,expires_at_ms "
               "FROM idempotency_records WHERE tenant_id=? AND actor=? AND key=?;");
  st.RequireOk();
  st.Text(1, tenant_id);
  st.Text(2, actor);
  st.Text(3, key);

  if (!st.NextRow()) return std::nullopt;
  return ReadIdempotency(st);
}

Result SqliteRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO idempotency_records(tenant_id,actor,key,fingerprint,status,cached_status_code,cached_body,created_at_ms,expires_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, r.tenant_id);
  st.Text(2, r.actor);
  st.Text(3, r.key);
  st.Text(4, r.fingerprint);
  st.I32(5, static_cast<int>(r.status));
  st.I32(6, r.cached_status_code);
  st.Text(7, r.cached_body);
  st.U64(8, r.created_at_ms);
  st.U64(9, r.expires_at_ms);

  return Translate(db, st.Step());
}

Result SqliteRepository::UpdateIdempotency(Transaction& t, const model::IdempotencyRecord& r, model::IdempotencyStatus expected) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE idempotency_records SET fingerprint=?,status=?,cached_status_code=?,cached_body=?,created_at_ms=?,expires_at_ms=? "
               "WHERE tenant_id=? AND actor=? AND key=? AND status=?;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, r.fingerprint);
  st.I32(2, static_cast<int>(r.status));
  st.I32(3, r.cached_status_code);
  st.Text(4, r.cached_body);
  st.U64(5, r.created_at_ms);
  st.U64(6, r.expires_at_ms);
  st.Text(7, r.tenant_id);
  st.Text(8, r.actor);
  st.Text(9, r.key);
  st.I32(10, static_cast<int>(expected));

  auto res = Translate(db, st.Step());
  if (!res) return res;

  if (sqlite3_changes(db) == 0) {
    return GetIdempotency(t, r.tenant_id, r.actor, r.key) ? Result::Err(ErrorCode::Conflict, "idempotency record status changed")
                                                          : Result::Err(ErrorCode::NotFound);
  }
  return Result::Ok();
}

Result SqliteRepository::PurgeExpiredIdempotency(Transaction& t, uint64_t now_ms, uint64_t& purged) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM idempotency_records WHERE expires_at_ms<=?;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.U64(1, now_ms);
  auto res = Translate(db, st.Step());
  if (!res) return res;

  purged = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result SqliteRepository::IncrementCounter(Transaction& t, const std::string& scope_key, uint64_t& value) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO sequence_counters(scope_key,value) VALUES(?,1) "
               "ON CONFLICT(scope_key) DO UPDATE SET value=value+1 RETURNING value;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, scope_key);
  const int rc = st.Step();
  if (rc != SQLITE_ROW) return Translate(db, rc);

  value = st.ColU64(0);

  // drain so the statement completes before finalize
  return Translate(db, st.Step());
}

std::optional<uint64_t> SqliteRepository::GetCounter(Transaction& t, const std::string& scope_key) {
  Statement st(TX(t).Handle(), "SELECT value FROM sequence_counters WHERE scope_key=?;");
  st.RequireOk();
  st.Text(1, scope_key);

  if (!st.NextRow()) return std::nullopt;
  return st.ColU64(0);
}

Result SqliteRepository::InsertCounter(Transaction& t, const std::string& scope_key, uint64_t value) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO sequence_counters(scope_key,value) VALUES(?,?);");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, scope_key);
  st.U64(2, value);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

std::optional<model::EntityLockRecord> SqliteRepository::GetLock(Transaction& t, const std::string& tenant_id, const std::string& entity_id) {
  Statement st(TX(t).Handle(),
               "SELECT tenant_id,entity_id,holder,acquired_at_ms,last_activity_at_ms FROM entity_locks WHERE tenant_id=? AND entity_id=?;");
  st.RequireOk();
  st.Text(1, tenant_id);
  st.Text(2, entity_id);

  if (!st.NextRow()) return std::nullopt;

  model::EntityLockRecord r;
  r.tenant_id           = st.ColText(0);
  r.entity_id           = st.ColText(1);
  r.holder              = st.ColText(2);
  r.acquired_at_ms      = st.ColU64(3);
  r.last_activity_at_ms = st.ColU64(4);
  return r;
}

Result SqliteRepository::InsertLock(Transaction& t, const model::EntityLockRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO entity_locks(tenant_id,entity_id,holder,acquired_at_ms,last_activity_at_ms) VALUES(?,?,?,?,?);");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, r.tenant_id);
  st.Text(2, r.entity_id);
  st.Text(3, r.holder);
  st.U64(4, r.acquired_at_ms);
  st.U64(5, r.last_activity_at_ms);
  return Translate(db, st.Step());
}

Result SqliteRepository::ReplaceLock(Transaction& t, const model::EntityLockRecord& r, const std::string& expected_holder) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE entity_locks SET holder=?,acquired_at_ms=?,last_activity_at_ms=? WHERE tenant_id=? AND entity_id=? AND holder=?;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, r.holder);
  st.U64(2, r.acquired_at_ms);
  st.U64(3, r.last_activity_at_ms);
  st.Text(4, r.tenant_id);
  st.Text(5, r.entity_id);
  st.Text(6, expected_holder);

  auto res = Translate(db, st.Step());
  if (!res) return res;

  if (sqlite3_changes(db) == 0) {
    return GetLock(t, r.tenant_id, r.entity_id) ? Result::Err(ErrorCode::Conflict, "lock holder changed") : Result::Err(ErrorCode::NotFound);
  }
  return Result::Ok();
}

Result SqliteRepository::DeleteLock(Transaction& t, const std::string& tenant_id, const std::string& entity_id, const std::string& expected_holder) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM entity_locks WHERE tenant_id=? AND entity_id=? AND holder=?;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, tenant_id);
  st.Text(2, entity_id);
  st.Text(3, expected_holder);

  auto res = Translate(db, st.Step());
  if (!res) return res;

  if (sqlite3_changes(db) == 0) {
    return GetLock(t, tenant_id, entity_id) ? Result::Err(ErrorCode::Conflict, "lock holder changed") : Result::Err(ErrorCode::NotFound);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Circuit breakers
// ------------------------------------------------------------------

static model::BreakerRecord ReadBreaker(const Statement& st) {
  model::BreakerRecord r;
  r.name               = st.ColText(0);
  r.state              = static_cast<model::BreakerState>(st.ColI32(1));
  r.failure_count      = static_cast<uint32_t>(st.ColU64(2));
  r.opened_at_ms       = st.ColU64(3);
  r.last_failure_at_ms = st.ColU64(4);
  r.trial_in_flight     = st.ColI32(5) != 0;
  r.trial_started_at_ms = st.ColU64(6);
  r.version             = st.ColU64(7);
  return r;
}

std::optional<model::BreakerRecord> SqliteRepository::GetBreaker(Transaction& t, const std::string& name) {
  Statement st(TX(t).Handle(),
               "SELECT name,state,failure_count,opened_at_ms,last_failure_at_ms,trial_in_flight,trial_started_at_ms,version FROM circuit_breakers WHERE name=?;");
  st.RequireOk();
  st.Text(1, name);

  if (!st.NextRow()) return std::nullopt;
  return ReadBreaker(st);
}

std::vector<model::BreakerRecord> SqliteRepository::ListBreakers(Transaction& t) {
  Statement st(TX(t).Handle(),
               "SELECT name,state,failure_count,opened_at_ms,last_failure_at_ms,trial_in_flight,trial_started_at_ms,version FROM circuit_breakers ORDER BY name;");
  st.RequireOk();

  std::vector<model::BreakerRecord> out;
  while (st.NextRow()) out.push_back(ReadBreaker(st));
  return out;
}

Result SqliteRepository::PutBreaker(Transaction& t, const model::BreakerRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  const char* sql = expected_version == 0
                        ? "INSERT INTO circuit_breakers(state,failure_count,opened_at_ms,last_failure_at_ms,trial_in_flight,trial_started_at_ms,version,name) "
                          "VALUES(?,?,?,?,?,?,?,?);"
                        : "UPDATE circuit_breakers SET state=?,failure_count=?,opened_at_ms=?,last_failure_at_ms=?,trial_in_flight=?,trial_started_at_ms=?,version=? "
                          "WHERE name=? AND version=?;";
  Statement st(db, sql);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.I32(1, static_cast<int>(r.state));
  st.U64(2, r.failure_count);
  st.U64(3, r.opened_at_ms);
  st.U64(4, r.last_failure_at_ms);
  st.I32(5, r.trial_in_flight ? 1 : 0);
  st.U64(6, r.trial_started_at_ms);
  st.U64(7, r.version);
  st.Text(8, r.name);
  if (expected_version != 0) st.U64(9, expected_version);

  auto res = Translate(db, st.Step());
  if (!res || expected_version == 0) return res;

  if (sqlite3_changes(db) == 0) {
    return GetBreaker(t, r.name) ? Result::Err(ErrorCode::Conflict, "breaker version changed") : Result::Err(ErrorCode::NotFound);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Cases
// ------------------------------------------------------------------

Result SqliteRepository::InsertCase(Transaction& t, const model::CaseRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO cases(tenant_id,case_id,title,status,version,resume_at_ms,parked_by,last_transition_actor,last_transition_at_ms,"
               "created_by,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, r.tenant_id);
  st.Text(2, r.case_id);
  st.Text(3, r.title);
  st.Text(4, r.status);
  st.U64(5, r.version);
  st.U64(6, r.resume_at_ms);
  st.Text(7, r.parked_by);
  st.Text(8, r.last_transition_actor);
  st.U64(9, r.last_transition_at_ms);
  st.Text(10, r.created_by);
  st.U64(11, r.created_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::CaseRecord> SqliteRepository::GetCase(Transaction& t, const std::string& tenant_id, const std::string& case_id) {
  const std::string sql = std::string("SELECT ") + kCaseColumns + " FROM cases WHERE tenant_id=? AND case_id=?;";
  Statement         st(TX(t).Handle(), sql.c_str());
  st.RequireOk();
  st.Text(1, tenant_id);
  st.Text(2, case_id);

  if (!st.NextRow()) return std::nullopt;
  return ReadCase(st);
}

std::vector<model::CaseRecord> SqliteRepository::ListCases(Transaction& t, const std::string& tenant_id) {
  const std::string sql = std::string("SELECT ") + kCaseColumns + " FROM cases WHERE tenant_id=? ORDER BY case_id;";
  Statement         st(TX(t).Handle(), sql.c_str());
  st.RequireOk();
  st.Text(1, tenant_id);

  std::vector<model::CaseRecord> out;
  while (st.NextRow()) out.push_back(ReadCase(st));
  return out;
}

Result SqliteRepository::UpdateCase(Transaction& t, const model::CaseRecord& r, uint64_t expected_version) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE cases SET title=?,status=?,version=?,resume_at_ms=?,parked_by=?,last_transition_actor=?,last_transition_at_ms=? "
               "WHERE tenant_id=? AND case_id=? AND version=?;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, r.title);
  st.Text(2, r.status);
  st.U64(3, r.version);
  st.U64(4, r.resume_at_ms);
  st.Text(5, r.parked_by);
  st.Text(6, r.last_transition_actor);
  st.U64(7, r.last_transition_at_ms);
  st.Text(8, r.tenant_id);
  st.Text(9, r.case_id);
  st.U64(10, expected_version);

  auto res = Translate(db, st.Step());
  if (!res) return res;

  if (sqlite3_changes(db) == 0) {
    return GetCase(t, r.tenant_id, r.case_id) ? Result::Err(ErrorCode::Conflict, "case version changed") : Result::Err(ErrorCode::NotFound);
  }
  return Result::Ok();
}

std::vector<model::CaseRecord> SqliteRepository::ListCasesDueForResume(Transaction& t, const std::string& status, uint64_t now_ms) {
  const std::string sql =
      std::string("SELECT ") + kCaseColumns + " FROM cases WHERE status=? AND resume_at_ms>0 AND resume_at_ms<=? ORDER BY resume_at_ms;";
  Statement st(TX(t).Handle(), sql.c_str());
  st.RequireOk();
  st.Text(1, status);
  st.U64(2, now_ms);

  std::vector<model::CaseRecord> out;
  while (st.NextRow()) out.push_back(ReadCase(st));
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendAudit(Transaction& t, const model::AuditEvent& e) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO audit_events(tenant_id,entity_id,kind,from_state,to_state,actor,annotation,at_ms) VALUES(?,?,?,?,?,?,?,?);");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  st.Text(1, e.tenant_id);
  st.Text(2, e.entity_id);
  st.Text(3, e.kind);
  st.Text(4, e.from_state);
  st.Text(5, e.to_state);
  st.Text(6, e.actor);
  st.Text(7, e.annotation);
  st.U64(8, e.at_ms);
  return Translate(db, st.Step());
}

std::vector<model::AuditEvent> SqliteRepository::ListAudit(Transaction& t, const std::string& tenant_id, const std::string& entity_id) {
  Statement st(TX(t).Handle(),
               "SELECT tenant_id,entity_id,kind,from_state,to_state,actor,annotation,at_ms FROM audit_events "
               "WHERE tenant_id=? AND entity_id=? ORDER BY seq;");
  st.RequireOk();
  st.Text(1, tenant_id);
  st.Text(2, entity_id);

  std::vector<model::AuditEvent> out;
  while (st.NextRow()) {
    model::AuditEvent e;
    e.tenant_id  = st.ColText(0);
    e.entity_id  = st.ColText(1);
    e.kind       = st.ColText(2);
    e.from_state = st.ColText(3);
    e.to_state   = st.ColText(4);
    e.actor      = st.ColText(5);
    e.annotation = st.ColText(6);
    e.at_ms      = st.ColU64(7);
    out.push_back(std::move(e));
  }
  return out;
}

} // namespace casetrack::db::sqlite
