#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/breaker/circuit_breaker.hpp"
#include "internal/idempotency/idempotency_coordinator.hpp"
#include "internal/txn/transaction_guard.hpp"
#include "internal/util/time.hpp"

namespace casetrack::service {

// Supplied by the upstream RPC layer for every request.
struct RequestMeta {
  std::string correlation_id;
  std::string tenant_id;
  std::string actor;

  // empty: no deduplication
  std::string idempotency_key;

  // fingerprint inputs
  std::string operation;
  std::string resource_path;
  std::string body;

  std::optional<std::chrono::milliseconds> timeout;

  // read-only handlers only; set explicitly by the caller
  bool skip_transaction = false;
};

using Response = idempotency::CachedResponse;

/*
  MutationExecutor

  Drives one request through the write-safety layer in order:

    0. Refuse mutations while any dependency circuit is OPEN
       (DependencyUnavailable; read-only requests still run)
    1. Reserve the idempotency key (replay short-circuits here)
    2. Run the handler inside the unit of work
    3. Check the deadline before commit (DeadlineExceeded rolls back)
    4. Commit
    5. Finalize the key: COMMITTED only when the unit of work committed

  Any exception finalizes the key as FAILED and is rethrown.
*/
class MutationExecutor {
 public:
  using Handler = std::function<Response(txn::TransactionContext&)>;

  // breakers may be null: no degraded-mode gate
  MutationExecutor(std::shared_ptr<idempotency::IdempotencyCoordinator> coordinator, std::shared_ptr<txn::TransactionGuard> guard,
                   util::ClockFn clock = util::Now, std::shared_ptr<breaker::CircuitBreaker> breakers = nullptr);

  Response Run(const RequestMeta& meta, const Handler& handler);

 private:
  std::shared_ptr<idempotency::IdempotencyCoordinator> coordinator_;
  std::shared_ptr<txn::TransactionGuard>               guard_;
  util::ClockFn                                        clock_;
  std::shared_ptr<breaker::CircuitBreaker>             breakers_;
};

} // namespace casetrack::service
