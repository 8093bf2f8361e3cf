#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/txn/transaction_guard.hpp"
#include "internal/util/time.hpp"
#include "state_machine.hpp"

namespace casetrack::lifecycle {

namespace case_status {
inline constexpr const char* kUnassigned = "UNASSIGNED";
inline constexpr const char* kOpen       = "OPEN";
inline constexpr const char* kPended     = "PENDED";
inline constexpr const char* kResolved   = "RESOLVED";
inline constexpr const char* kFiled      = "FILED";
} // namespace case_status

inline constexpr const char* kResumeAtField = "resume_at";

/*
  UNASSIGNED -> OPEN
  UNASSIGNED | OPEN -> PENDED    (comment + resume_at)
  UNASSIGNED | OPEN -> RESOLVED  (comment)
  UNASSIGNED | OPEN -> FILED     (comment)
  PENDED -> OPEN                 (system only, resume sweep)
  RESOLVED, FILED                terminal
*/
TransitionTable BuildCaseTransitionTable();

/*
  resume_at accepts:
    YYYY-MM-DD   -> 08:00 IST (02:30 UTC) on that day
    digits       -> unix milliseconds
  Throws InvalidArgument otherwise, or when the instant is not after the epoch.
*/
uint64_t ParseResumeAt(const std::string& value);

/*
  CaseLifecycle

  Applies case status transitions inside the caller's unit of work:
  admission check, version-conditional update, one TRANSITION audit
  event. A version mismatch raises ConcurrentModification and the unit
  of work rolls back.
*/
class CaseLifecycle {
 public:
  CaseLifecycle(std::shared_ptr<db::Repository> repo, std::shared_ptr<txn::TransactionGuard> guard, util::ClockFn clock = util::Now);

  db::model::CaseRecord ApplyTransition(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& case_id,
                                        const TransitionRequest& request);

  // Resumes every parked case whose resume_at has passed, each in its own unit of work.
  std::size_t ResumeDue();

  const StateMachine& Machine() const {
    return machine_;
  }

 private:
  std::shared_ptr<db::Repository>        repo_;
  std::shared_ptr<txn::TransactionGuard> guard_;
  util::ClockFn                          clock_;
  StateMachine                           machine_;
};

} // namespace casetrack::lifecycle
