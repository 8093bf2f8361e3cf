#include "entity_lock_manager.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace casetrack::lock {

using db::model::EntityLockRecord;
namespace audit_kind = db::model::audit_kind;

EntityLockManager::EntityLockManager(std::shared_ptr<db::Repository> repo, std::shared_ptr<txn::TransactionGuard> guard, LockOptions options,
                                     util::ClockFn clock)
    : repo_(std::move(repo)), guard_(std::move(guard)), options_(options), clock_(std::move(clock)) {
}

bool EntityLockManager::IsLive(const EntityLockRecord& lock, uint64_t now_ms) const {
  // a last_activity in the future (clock skew between writers) counts as live
  if (now_ms < lock.last_activity_at_ms) return true;
  return now_ms - lock.last_activity_at_ms < static_cast<uint64_t>(options_.inactivity_timeout.count());
}

void EntityLockManager::ThrowConflict(const EntityLockRecord& lock) {
  observability::Metrics::Instance().RecordLockEvent("conflict");
  throw util::LockConflict("entity " + lock.entity_id + " is locked by " + lock.holder, lock.holder, lock.acquired_at_ms,
                           lock.last_activity_at_ms);
}

void EntityLockManager::Audit(db::Transaction& tx, const std::string& tenant_id, const std::string& entity_id, const char* kind,
                              const std::string& actor, const std::string& annotation, uint64_t now_ms) {
  db::model::AuditEvent event;
  event.tenant_id  = tenant_id;
  event.entity_id  = entity_id;
  event.kind       = kind;
  event.actor      = actor;
  event.annotation = annotation;
  event.at_ms      = now_ms;
  db::ThrowIfDbError(repo_->AppendAudit(tx, event), "append lock audit event");
}

AcquireResult EntityLockManager::Acquire(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id,
                                         const std::string& actor) {
  if (actor.empty()) {
    throw util::InvalidArgument("lock holder identity is required");
  }

  auto&          tx     = guard_->RequireActive(ctx, "lock acquire");
  const uint64_t now_ms = util::ToUnixMillis(clock_());

  EntityLockRecord fresh;
  fresh.tenant_id           = tenant_id;
  fresh.entity_id           = entity_id;
  fresh.holder              = actor;
  fresh.acquired_at_ms      = now_ms;
  fresh.last_activity_at_ms = now_ms;

  AcquireResult result;
  auto          current = repo_->GetLock(tx, tenant_id, entity_id);

  if (!current) {
    auto inserted = repo_->InsertLock(tx, fresh);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      // lost an insert race; report whoever won
      auto winner = repo_->GetLock(tx, tenant_id, entity_id);
      if (!winner) {
        throw util::ConcurrentModification("lock on " + entity_id + " changed concurrently");
      }
      ThrowConflict(*winner);
    }
    db::ThrowIfDbError(inserted, "insert lock");

    Audit(tx, tenant_id, entity_id, audit_kind::kLockAcquired, actor, {}, now_ms);
    observability::Metrics::Instance().RecordLockEvent("acquired");
    result.outcome = AcquireOutcome::kGranted;
    result.lock    = fresh;
    return result;
  }

  const bool live = IsLive(*current, now_ms);

  if (current->holder == actor) {
    EntityLockRecord updated = *current;
    updated.last_activity_at_ms = now_ms;
    if (!live) {
      updated.acquired_at_ms = now_ms;
    }
    db::ThrowIfDbError(repo_->ReplaceLock(tx, updated, actor), "refresh lock");

    if (live) {
      observability::Metrics::Instance().RecordLockEvent("refreshed");
      result.outcome = AcquireOutcome::kRefreshed;
    } else {
      Audit(tx, tenant_id, entity_id, audit_kind::kLockAcquired, actor, {}, now_ms);
      observability::Metrics::Instance().RecordLockEvent("acquired");
      result.outcome = AcquireOutcome::kGranted;
    }
    result.lock = updated;
    return result;
  }

  if (live) {
    ThrowConflict(*current);
  }

  // lapsed lock held by someone else: release it on their behalf, then grant
  const std::string annotation = "auto-unlocked after " + util::DescribeDuration(options_.inactivity_timeout) +
                                 " of inactivity, previous holder " + current->holder;
  Audit(tx, tenant_id, entity_id, audit_kind::kLockAutoReleased, kSystemActor, annotation, now_ms);
  db::ThrowIfDbError(repo_->ReplaceLock(tx, fresh, current->holder), "take over lapsed lock");
  Audit(tx, tenant_id, entity_id, audit_kind::kLockAcquired, actor, {}, now_ms);

  CASETRACK_LOG_INFO("lock auto-released", {observability::StringField("tenant", tenant_id), observability::StringField("entity", entity_id),
                                            observability::StringField("previous_holder", current->holder),
                                            observability::StringField("holder", actor)});
  observability::Metrics::Instance().RecordLockEvent("auto_released");

  result.outcome         = AcquireOutcome::kTakenOver;
  result.lock            = fresh;
  result.previous_holder = current->holder;
  return result;
}

void EntityLockManager::Release(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id, const std::string& actor) {
  auto&          tx     = guard_->RequireActive(ctx, "lock release");
  const uint64_t now_ms = util::ToUnixMillis(clock_());

  auto current = repo_->GetLock(tx, tenant_id, entity_id);
  if (!current) {
    throw util::Forbidden("no lock on " + entity_id + " to release");
  }
  if (current->holder != actor) {
    throw util::Forbidden("lock on " + entity_id + " is held by another user");
  }

  db::ThrowIfDbError(repo_->DeleteLock(tx, tenant_id, entity_id, actor), "release lock");
  Audit(tx, tenant_id, entity_id, audit_kind::kLockReleased, actor, {}, now_ms);
  observability::Metrics::Instance().RecordLockEvent("released");
}

EntityLockRecord EntityLockManager::Heartbeat(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id,
                                              const std::string& actor) {
  auto&          tx     = guard_->RequireActive(ctx, "lock heartbeat");
  const uint64_t now_ms = util::ToUnixMillis(clock_());

  auto current = repo_->GetLock(tx, tenant_id, entity_id);
  if (!current || current->holder != actor) {
    throw util::Forbidden("caller does not hold the lock on " + entity_id);
  }
  if (!IsLive(*current, now_ms)) {
    throw util::Forbidden("lock on " + entity_id + " lapsed after " + util::DescribeDuration(options_.inactivity_timeout) + " of inactivity");
  }

  EntityLockRecord updated    = *current;
  updated.last_activity_at_ms = now_ms;
  db::ThrowIfDbError(repo_->ReplaceLock(tx, updated, actor), "heartbeat lock");
  return updated;
}

std::optional<LockView> EntityLockManager::Inspect(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id) {
  auto& tx      = guard_->RequireActive(ctx, "lock inspect");
  auto  current = repo_->GetLock(tx, tenant_id, entity_id);
  if (!current) {
    return std::nullopt;
  }
  return LockView{*current, IsLive(*current, util::ToUnixMillis(clock_()))};
}

void EntityLockManager::EnsureNotLockedByOther(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id,
                                               const std::string& actor) {
  auto& tx      = guard_->RequireActive(ctx, "lock check");
  auto  current = repo_->GetLock(tx, tenant_id, entity_id);
  if (current && current->holder != actor && IsLive(*current, util::ToUnixMillis(clock_()))) {
    ThrowConflict(*current);
  }
}

} // namespace casetrack::lock
