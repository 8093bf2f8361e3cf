#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace casetrack::idempotency {

struct CachedResponse {
  int         status_code = 0;
  std::string body;

  // set on responses served from the replay cache
  bool replayed = false;
};

/*
  Proof of a reservation. Finalize() accepts each token exactly once.
  A token created for a request without a key carries no record and
  finalizing it only marks it used.
*/
class ReservationToken {
 public:
  bool HasKey() const {
    return !key_.empty();
  }

  bool Finalized() const {
    return finalized_;
  }

  const std::string& Key() const {
    return key_;
  }

 private:
  friend class IdempotencyCoordinator;

  std::string tenant_id_;
  std::string actor_;
  std::string key_;
  std::string fingerprint_;
  uint64_t    reserved_at_ms_ = 0;
  bool        finalized_      = false;
};

struct Reservation {
  // set: serve this response, do not execute the handler
  std::optional<CachedResponse> replay;

  // valid when replay is empty
  ReservationToken token;

  bool IsReplay() const {
    return replay.has_value();
  }
};

struct IdempotencyOptions {
  // how long a COMMITTED response is replayed
  std::chrono::milliseconds retention{std::chrono::hours(24)};

  // how long a PENDING reservation blocks retries; an owner that dies
  // before Finalize releases the key once this lapses
  std::chrono::milliseconds pending_lease{std::chrono::minutes(5)};
};

/*
  IdempotencyCoordinator

  Deduplicates retried mutations keyed by (tenant, actor, key).

  Reserve runs in its own short store transaction, before the request's
  unit of work opens:

    live COMMITTED, same fingerprint   -> replay cached response
    live PENDING,   same fingerprint   -> IdempotencyInProgress
    live PENDING/COMMITTED, other fp   -> FingerprintConflict
    FAILED, expired, or absent         -> (re)claim as PENDING, proceed

  A PENDING record expires after pending_lease. Finalize moves it to
  COMMITTED (storing the response, expiry pushed to created + retention)
  only when the unit of work committed, otherwise to FAILED so a retry
  re-executes. A token whose record was reclaimed by a later reservation
  finalizes nothing.
*/
class IdempotencyCoordinator {
 public:
  IdempotencyCoordinator(std::shared_ptr<db::Repository> repo, IdempotencyOptions options = {}, util::ClockFn clock = util::Now);

  Reservation Reserve(const std::string& tenant_id, const std::string& actor, const std::string& key, const std::string& fingerprint);

  void Finalize(ReservationToken& token, bool committed, const CachedResponse& response);

  // Deletes expired records from the store and the replay cache.
  uint64_t SweepExpired();

  std::size_t CachedEntries() const;

 private:
  struct CacheEntry {
    std::string    fingerprint;
    CachedResponse response;
    uint64_t       expires_at_ms = 0;
  };

  std::optional<CachedResponse> LookupCache(const std::string& cache_key, const std::string& fingerprint, uint64_t now_ms);
  void                          StoreCache(const std::string& cache_key, CacheEntry entry);

  static CachedResponse Replay(int status_code, std::string body);

  std::shared_ptr<db::Repository> repo_;
  IdempotencyOptions              options_;
  util::ClockFn                   clock_;

  mutable std::mutex                          cache_mutex_;
  std::unordered_map<std::string, CacheEntry> cache_;
};

} // namespace casetrack::idempotency
