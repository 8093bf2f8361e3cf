#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/txn/transaction_guard.hpp"
#include "internal/util/time.hpp"

namespace casetrack::lock {

inline constexpr const char* kSystemActor = "SYSTEM";

struct LockOptions {
  std::chrono::milliseconds inactivity_timeout{std::chrono::hours(2)};
};

enum class AcquireOutcome {
  kGranted,   // no previous lock, or the caller's own lock had lapsed
  kRefreshed, // caller already held a live lock
  kTakenOver, // another holder's lock had lapsed and was auto-released
};

struct AcquireResult {
  AcquireOutcome                outcome = AcquireOutcome::kGranted;
  db::model::EntityLockRecord   lock;
  std::optional<std::string>    previous_holder;
};

struct LockView {
  db::model::EntityLockRecord lock;
  bool                        live = false;
};

/*
  EntityLockManager

  Advisory editing locks, one per (tenant, entity). A lock is live while
  now - last_activity_at < inactivity_timeout; liveness is computed on
  read, nothing expires in the background.

  Acquire  -> AcquireResult | throws LockConflict (live lock held by another)
  Release  -> ok            | throws Forbidden    (not the holder / no lock)
  Heartbeat-> refreshed     | throws Forbidden    (not the live holder)

  All operations run inside the caller's unit of work; acquire, release
  and auto-release append audit events in that same unit of work.
*/
class EntityLockManager {
 public:
  EntityLockManager(std::shared_ptr<db::Repository> repo, std::shared_ptr<txn::TransactionGuard> guard, LockOptions options = {},
                    util::ClockFn clock = util::Now);

  AcquireResult Acquire(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id, const std::string& actor);

  void Release(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id, const std::string& actor);

  db::model::EntityLockRecord Heartbeat(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id,
                                        const std::string& actor);

  std::optional<LockView> Inspect(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id);

  // Throws LockConflict when a live lock on the entity belongs to someone other than `actor`.
  void EnsureNotLockedByOther(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& entity_id, const std::string& actor);

  bool IsLive(const db::model::EntityLockRecord& lock, uint64_t now_ms) const;

  std::chrono::milliseconds InactivityTimeout() const {
    return options_.inactivity_timeout;
  }

 private:
  [[noreturn]] static void ThrowConflict(const db::model::EntityLockRecord& lock);

  void Audit(db::Transaction& tx, const std::string& tenant_id, const std::string& entity_id, const char* kind, const std::string& actor,
             const std::string& annotation, uint64_t now_ms);

  std::shared_ptr<db::Repository>        repo_;
  std::shared_ptr<txn::TransactionGuard> guard_;
  LockOptions                            options_;
  util::ClockFn                          clock_;
};

} // namespace casetrack::lock
