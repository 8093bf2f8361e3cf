#include "pg_pool.hpp"

namespace casetrack::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_idempotency",
               "SELECT tenant_id,actor,key,fingerprint,status,cached_status_code,cached_body,created_at_ms,expires_at_ms "
               "FROM idempotency_records WHERE tenant_id=$1 AND actor=$2 AND key=$3 FOR UPDATE");

  conn.prepare("insert_idempotency",
               "INSERT INTO idempotency_records(tenant_id,actor,key,fingerprint,status,cached_status_code,cached_body,created_at_ms,expires_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) ON CONFLICT DO NOTHING");

  conn.prepare("update_idempotency",
               "UPDATE idempotency_records SET fingerprint=$4,status=$5,cached_status_code=$6,cached_body=$7,created_at_ms=$8,expires_at_ms=$9 "
               "WHERE tenant_id=$1 AND actor=$2 AND key=$3 AND status=$10");

  conn.prepare("increment_counter",
               "INSERT INTO sequence_counters(scope_key,value) VALUES($1,1) "
               "ON CONFLICT(scope_key) DO UPDATE SET value=sequence_counters.value+1 RETURNING value");

  conn.prepare("get_lock",
               "SELECT tenant_id,entity_id,holder,acquired_at_ms,last_activity_at_ms FROM entity_locks "
               "WHERE tenant_id=$1 AND entity_id=$2 FOR UPDATE");

  conn.prepare("get_case",
               "SELECT tenant_id,case_id,title,status,version,resume_at_ms,parked_by,last_transition_actor,last_transition_at_ms,created_by,"
               "created_at_ms FROM cases WHERE tenant_id=$1 AND case_id=$2");

  conn.prepare("update_case",
               "UPDATE cases SET title=$3,status=$4,version=$5,resume_at_ms=$6,parked_by=$7,last_transition_actor=$8,last_transition_at_ms=$9 "
               "WHERE tenant_id=$1 AND case_id=$2 AND version=$10");

  conn.prepare("append_audit",
               "INSERT INTO audit_events(tenant_id,entity_id,kind,from_state,to_state,actor,annotation,at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace casetrack::db::postgres
