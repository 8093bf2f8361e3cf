#include "migrations.hpp"

namespace casetrack::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS idempotency_records (tenant_id TEXT NOT NULL, actor TEXT NOT NULL, key TEXT NOT NULL, fingerprint TEXT NOT NULL, status INTEGER NOT NULL, cached_status_code INTEGER NOT NULL DEFAULT 0, cached_body TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, PRIMARY KEY (tenant_id, actor, key));",
      "CREATE INDEX IF NOT EXISTS idempotency_records_expiry ON idempotency_records(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS sequence_counters (scope_key TEXT PRIMARY KEY, value INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entity_locks (tenant_id TEXT NOT NULL, entity_id TEXT NOT NULL, holder TEXT NOT NULL, acquired_at_ms INTEGER NOT NULL, last_activity_at_ms INTEGER NOT NULL, PRIMARY KEY (tenant_id, entity_id));",
      "CREATE TABLE IF NOT EXISTS circuit_breakers (name TEXT PRIMARY KEY, state INTEGER NOT NULL, failure_count INTEGER NOT NULL, opened_at_ms INTEGER NOT NULL, last_failure_at_ms INTEGER NOT NULL, trial_in_flight INTEGER NOT NULL, trial_started_at_ms INTEGER NOT NULL DEFAULT 0, version INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS cases (tenant_id TEXT NOT NULL, case_id TEXT NOT NULL, title TEXT NOT NULL, status TEXT NOT NULL, version INTEGER NOT NULL, resume_at_ms INTEGER NOT NULL DEFAULT 0, parked_by TEXT NOT NULL DEFAULT '', last_transition_actor TEXT NOT NULL DEFAULT '', last_transition_at_ms INTEGER NOT NULL DEFAULT 0, created_by TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (tenant_id, case_id));",
      "CREATE INDEX IF NOT EXISTS cases_resume ON cases(status, resume_at_ms);",
      "CREATE TABLE IF NOT EXISTS audit_events (seq INTEGER PRIMARY KEY AUTOINCREMENT, tenant_id TEXT NOT NULL, entity_id TEXT NOT NULL, kind TEXT NOT NULL, from_state TEXT NOT NULL DEFAULT '', to_state TEXT NOT NULL DEFAULT '', actor TEXT NOT NULL, annotation TEXT NOT NULL DEFAULT '', at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS audit_events_entity ON audit_events(tenant_id, entity_id, seq);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS idempotency_records (tenant_id TEXT NOT NULL, actor TEXT NOT NULL, key TEXT NOT NULL, fingerprint TEXT NOT NULL, status SMALLINT NOT NULL, cached_status_code INTEGER NOT NULL DEFAULT 0, cached_body TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, PRIMARY KEY (tenant_id, actor, key));",
      "CREATE INDEX IF NOT EXISTS idempotency_records_expiry ON idempotency_records(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS sequence_counters (scope_key TEXT PRIMARY KEY, value BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entity_locks (tenant_id TEXT NOT NULL, entity_id TEXT NOT NULL, holder TEXT NOT NULL, acquired_at_ms BIGINT NOT NULL, last_activity_at_ms BIGINT NOT NULL, PRIMARY KEY (tenant_id, entity_id));",
      "CREATE TABLE IF NOT EXISTS circuit_breakers (name TEXT PRIMARY KEY, state SMALLINT NOT NULL, failure_count INTEGER NOT NULL, opened_at_ms BIGINT NOT NULL, last_failure_at_ms BIGINT NOT NULL, trial_in_flight BOOLEAN NOT NULL, trial_started_at_ms BIGINT NOT NULL DEFAULT 0, version BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS cases (tenant_id TEXT NOT NULL, case_id TEXT NOT NULL, title TEXT NOT NULL, status TEXT NOT NULL, version BIGINT NOT NULL, resume_at_ms BIGINT NOT NULL DEFAULT 0, parked_by TEXT NOT NULL DEFAULT '', last_transition_actor TEXT NOT NULL DEFAULT '', last_transition_at_ms BIGINT NOT NULL DEFAULT 0, created_by TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (tenant_id, case_id));",
      "CREATE INDEX IF NOT EXISTS cases_resume ON cases(status, resume_at_ms);",
      "CREATE TABLE IF NOT EXISTS audit_events (seq BIGSERIAL PRIMARY KEY, tenant_id TEXT NOT NULL, entity_id TEXT NOT NULL, kind TEXT NOT NULL, from_state TEXT NOT NULL DEFAULT '', to_state TEXT NOT NULL DEFAULT '', actor TEXT NOT NULL, annotation TEXT NOT NULL DEFAULT '', at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS audit_events_entity ON audit_events(tenant_id, entity_id, seq);"};
  return kSchema;
}

} // namespace casetrack::db::sql
