#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/breaker/circuit_breaker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/idempotency/idempotency_coordinator.hpp"
#include "internal/lifecycle/case_lifecycle.hpp"
#include "internal/lock/entity_lock_manager.hpp"
#include "internal/runtime/periodic_worker.hpp"
#include "internal/sequence/sequence_counter.hpp"
#include "internal/service/case_service.hpp"
#include "internal/service/mutation_executor.hpp"
#include "internal/txn/transaction_guard.hpp"
#include "internal/util/time.hpp"

namespace casetrack::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process. Workers are built but not started.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  // Breaker state store. Shares the repository when the backend can run
  // a second transaction beside an open request transaction.
  std::shared_ptr<db::Repository> breaker_store;

  std::shared_ptr<txn::TransactionGuard>               guard;
  std::shared_ptr<idempotency::IdempotencyCoordinator> coordinator;
  std::shared_ptr<service::MutationExecutor>           executor;
  std::shared_ptr<sequence::SequenceCounter>           sequence;
  std::shared_ptr<lock::EntityLockManager>             locks;
  std::shared_ptr<lifecycle::CaseLifecycle>            lifecycle;
  std::shared_ptr<breaker::CircuitBreaker>             breakers;
  std::shared_ptr<service::CaseService>                cases;

  std::vector<std::shared_ptr<runtime::PeriodicWorker>> background_workers;
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete store types.
  Creates the schema on SQL backends before returning.
*/
Application Build(const casetrack::runtime::config::RuntimeConfig& config, util::ClockFn clock = util::Now);

} // namespace casetrack::factory
