#include "idempotency_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace casetrack::idempotency {

using db::model::IdempotencyRecord;
using db::model::IdempotencyStatus;

namespace {

std::string CacheKey(const std::string& tenant_id, const std::string& actor, const std::string& key) {
  return tenant_id + "#" + actor + "#" + key;
}

} // namespace

IdempotencyCoordinator::IdempotencyCoordinator(std::shared_ptr<db::Repository> repo, IdempotencyOptions options, util::ClockFn clock)
    : repo_(std::move(repo)), options_(options), clock_(std::move(clock)) {
}

CachedResponse IdempotencyCoordinator::Replay(int status_code, std::string body) {
  CachedResponse response;
  response.status_code = status_code;
  response.body        = std::move(body);
  response.replayed    = true;
  return response;
}

Reservation IdempotencyCoordinator::Reserve(const std::string& tenant_id, const std::string& actor, const std::string& key,
                                            const std::string& fingerprint) {
  Reservation reservation;
  reservation.token.tenant_id_   = tenant_id;
  reservation.token.actor_       = actor;
  reservation.token.key_         = key;
  reservation.token.fingerprint_ = fingerprint;

  if (key.empty()) {
    return reservation;
  }

  const uint64_t now_ms    = util::ToUnixMillis(clock_());
  const auto     cache_key = CacheKey(tenant_id, actor, key);

  if (auto cached = LookupCache(cache_key, fingerprint, now_ms)) {
    observability::Metrics::Instance().RecordIdempotencyOutcome("replay");
    CASETRACK_LOG_INFO("idempotent replay", {observability::StringField("tenant", tenant_id), observability::StringField("key", key),
                                             observability::StringField("source", "cache")});
    reservation.replay = std::move(cached);
    return reservation;
  }

  auto tx       = repo_->Begin();
  auto existing = repo_->GetIdempotency(*tx, tenant_id, actor, key);

  const bool live = existing && existing->expires_at_ms > now_ms && existing->status != IdempotencyStatus::kFailed;
  if (live) {
    if (existing->fingerprint != fingerprint) {
      observability::Metrics::Instance().RecordIdempotencyOutcome("fingerprint_conflict");
      CASETRACK_LOG_WARN("idempotency key reused with a different payload",
                         {observability::StringField("tenant", tenant_id), observability::StringField("key", key)});
      throw util::FingerprintConflict("idempotency key '" + key + "' was already used with a different request");
    }

    if (existing->status == IdempotencyStatus::kCommitted) {
      tx->Rollback();
      StoreCache(cache_key, {existing->fingerprint, Replay(existing->cached_status_code, existing->cached_body), existing->expires_at_ms});

      observability::Metrics::Instance().RecordIdempotencyOutcome("replay");
      CASETRACK_LOG_INFO("idempotent replay", {observability::StringField("tenant", tenant_id), observability::StringField("key", key),
                                               observability::StringField("source", "store")});
      reservation.replay = Replay(existing->cached_status_code, existing->cached_body);
      return reservation;
    }

    observability::Metrics::Instance().RecordIdempotencyOutcome("in_progress");
    throw util::IdempotencyInProgress("a request with idempotency key '" + key + "' is still in progress");
  }

  IdempotencyRecord record;
  record.tenant_id     = tenant_id;
  record.actor         = actor;
  record.key           = key;
  record.fingerprint   = fingerprint;
  record.status        = IdempotencyStatus::kPending;
  record.created_at_ms = now_ms;
  record.expires_at_ms = now_ms + static_cast<uint64_t>(options_.pending_lease.count());

  db::Result result = existing ? repo_->UpdateIdempotency(*tx, record, existing->status) : repo_->InsertIdempotency(*tx, record);

  // a concurrent request claimed the key between our read and write
  if (result.code == db::ErrorCode::AlreadyExists || result.code == db::ErrorCode::Conflict) {
    observability::Metrics::Instance().RecordIdempotencyOutcome("in_progress");
    throw util::IdempotencyInProgress("a request with idempotency key '" + key + "' is still in progress");
  }
  db::ThrowIfDbError(result, "reserve idempotency key");

  tx->Commit();
  reservation.token.reserved_at_ms_ = now_ms;

  if (existing) {
    std::lock_guard lock(cache_mutex_);
    cache_.erase(cache_key);
  }

  observability::Metrics::Instance().RecordIdempotencyOutcome("proceed");
  return reservation;
}

void IdempotencyCoordinator::Finalize(ReservationToken& token, bool committed, const CachedResponse& response) {
  if (token.finalized_) {
    throw util::InvalidState("idempotency token already finalized");
  }
  token.finalized_ = true;

  if (!token.HasKey()) {
    return;
  }

  auto tx       = repo_->Begin();
  auto existing = repo_->GetIdempotency(*tx, token.tenant_id_, token.actor_, token.key_);

  // swept, or reclaimed by a retry after expiry: nothing of ours to finalize
  if (!existing || existing->status != IdempotencyStatus::kPending || existing->created_at_ms != token.reserved_at_ms_ ||
      existing->fingerprint != token.fingerprint_) {
    CASETRACK_LOG_WARN("idempotency record changed before finalize",
                       {observability::StringField("tenant", token.tenant_id_), observability::StringField("key", token.key_)});
    return;
  }

  IdempotencyRecord record = *existing;
  if (committed) {
    record.status             = IdempotencyStatus::kCommitted;
    record.cached_status_code = response.status_code;
    record.cached_body        = response.body;
    record.expires_at_ms      = record.created_at_ms + static_cast<uint64_t>(options_.retention.count());
  } else {
    record.status = IdempotencyStatus::kFailed;
  }

  db::ThrowIfDbError(repo_->UpdateIdempotency(*tx, record, IdempotencyStatus::kPending), "finalize idempotency key");
  tx->Commit();

  if (committed) {
    StoreCache(CacheKey(token.tenant_id_, token.actor_, token.key_),
               {record.fingerprint, Replay(record.cached_status_code, record.cached_body), record.expires_at_ms});
  }
}

uint64_t IdempotencyCoordinator::SweepExpired() {
  const uint64_t now_ms = util::ToUnixMillis(clock_());

  uint64_t purged = 0;
  auto     tx     = repo_->Begin();
  db::ThrowIfDbError(repo_->PurgeExpiredIdempotency(*tx, now_ms, purged), "sweep idempotency records");
  tx->Commit();

  {
    std::lock_guard lock(cache_mutex_);
    std::erase_if(cache_, [&](const auto& entry) { return entry.second.expires_at_ms <= now_ms; });
  }

  if (purged > 0) {
    CASETRACK_LOG_INFO("idempotency sweep", {observability::IntField("purged", static_cast<int64_t>(purged))});
  }
  return purged;
}

std::size_t IdempotencyCoordinator::CachedEntries() const {
  std::lock_guard lock(cache_mutex_);
  return cache_.size();
}

std::optional<CachedResponse> IdempotencyCoordinator::LookupCache(const std::string& cache_key, const std::string& fingerprint, uint64_t now_ms) {
  std::lock_guard lock(cache_mutex_);

  auto it = cache_.find(cache_key);
  if (it == cache_.end()) {
    return std::nullopt;
  }
  if (it->second.expires_at_ms <= now_ms) {
    cache_.erase(it);
    return std::nullopt;
  }
  // mismatch is decided against the store record
  if (it->second.fingerprint != fingerprint) {
    return std::nullopt;
  }
  return it->second.response;
}

void IdempotencyCoordinator::StoreCache(const std::string& cache_key, CacheEntry entry) {
  std::lock_guard lock(cache_mutex_);
  cache_[cache_key] = std::move(entry);
}

} // namespace casetrack::idempotency
