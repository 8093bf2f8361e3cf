#pragma once

#include <memory>

#include "internal/util/time.hpp"

namespace casetrack::db {
class Repository;
}
namespace casetrack::txn {
class TransactionGuard;
}
namespace casetrack::sequence {
class SequenceCounter;
}
namespace casetrack::lock {
class EntityLockManager;
}
namespace casetrack::lifecycle {
class CaseLifecycle;
}

namespace casetrack::service {

class MutationExecutor;

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<casetrack::db::Repository>           repository;
  std::shared_ptr<casetrack::txn::TransactionGuard>    guard;
  std::shared_ptr<MutationExecutor>                    executor;
  std::shared_ptr<casetrack::sequence::SequenceCounter> sequence;
  std::shared_ptr<casetrack::lock::EntityLockManager>  locks;
  std::shared_ptr<casetrack::lifecycle::CaseLifecycle> lifecycle;
  util::ClockFn                                        clock = util::Now;
};

} // namespace casetrack::service
