#include "case_lifecycle.hpp"

#include <algorithm>
#include <cctype>

#include "internal/lock/entity_lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace casetrack::lifecycle {

TransitionTable BuildCaseTransitionTable() {
  const TransitionRule comment{.requires_annotation = true};
  const TransitionRule park{.requires_annotation = true, .required_fields = {kResumeAtField}};
  const TransitionRule resume{.system_only = true};

  TransitionTable table;
  for (const char* from : {case_status::kUnassigned, case_status::kOpen}) {
    table.Allow(from, case_status::kPended, park)
        .Allow(from, case_status::kResolved, comment)
        .Allow(from, case_status::kFiled, comment);
  }
  table.Allow(case_status::kUnassigned, case_status::kOpen)
      .Allow(case_status::kPended, case_status::kOpen, resume)
      .Terminal(case_status::kResolved)
      .Terminal(case_status::kFiled);
  return table;
}

uint64_t ParseResumeAt(const std::string& value) {
  if (!value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    uint64_t ms = 0;
    try {
      ms = std::stoull(value);
    } catch (const std::out_of_range&) {
      throw util::InvalidArgument("resume_at out of range: " + value);
    }
    // 0 marks "not parked" in the store; the resume sweep would never see it
    if (ms == 0) {
      throw util::InvalidArgument("resume_at must be after the epoch: " + value);
    }
    return ms;
  }

  // 08:00 in Asia/Kolkata (UTC+05:30, no DST)
  const auto resume = util::ParseIsoDate(value) + std::chrono::hours(2) + std::chrono::minutes(30);
  if (resume.time_since_epoch() <= util::Clock::duration::zero()) {
    throw util::InvalidArgument("resume_at must be after the epoch: " + value);
  }
  return util::ToUnixMillis(resume);
}

CaseLifecycle::CaseLifecycle(std::shared_ptr<db::Repository> repo, std::shared_ptr<txn::TransactionGuard> guard, util::ClockFn clock)
    : repo_(std::move(repo)),
      guard_(std::move(guard)),
      clock_(std::move(clock)),
      machine_("case", BuildCaseTransitionTable(), lock::kSystemActor) {
}

db::model::CaseRecord CaseLifecycle::ApplyTransition(txn::TransactionContext& ctx, const std::string& tenant_id, const std::string& case_id,
                                                     const TransitionRequest& request) {
  auto& tx = guard_->RequireActive(ctx, "case transition");

  auto current = repo_->GetCase(tx, tenant_id, case_id);
  if (!current) {
    throw util::NotFound("case " + case_id + " not found");
  }

  machine_.Check(current->status, request);

  const uint64_t now_ms = util::ToUnixMillis(clock_());

  db::model::CaseRecord updated = *current;
  updated.status                = request.to;
  updated.version               = current->version + 1;
  updated.last_transition_actor = request.actor;
  updated.last_transition_at_ms = now_ms;

  if (request.to == case_status::kPended) {
    updated.resume_at_ms = ParseResumeAt(request.fields.at(kResumeAtField));
    updated.parked_by    = request.actor;
  } else {
    updated.resume_at_ms = 0;
    updated.parked_by.clear();
  }

  db::ThrowIfDbError(repo_->UpdateCase(tx, updated, current->version), "update case " + case_id);

  db::model::AuditEvent event;
  event.tenant_id  = tenant_id;
  event.entity_id  = case_id;
  event.kind       = db::model::audit_kind::kTransition;
  event.from_state = current->status;
  event.to_state   = request.to;
  event.actor      = request.actor;
  event.annotation = request.annotation;
  event.at_ms      = now_ms;
  db::ThrowIfDbError(repo_->AppendAudit(tx, event), "append transition audit event");

  observability::Metrics::Instance().RecordLifecycleTransition(current->status, request.to);
  return updated;
}

std::size_t CaseLifecycle::ResumeDue() {
  const uint64_t now_ms = util::ToUnixMillis(clock_());

  txn::TransactionContext scan;
  scan.skipped = true;
  const auto due = guard_->Execute(scan, [&](db::Transaction& tx) { return repo_->ListCasesDueForResume(tx, case_status::kPended, now_ms); });

  std::size_t resumed = 0;
  for (const auto& record : due) {
    TransitionRequest request;
    request.to         = case_status::kOpen;
    request.actor      = lock::kSystemActor;
    request.annotation = "resume date reached";

    txn::TransactionContext ctx;
    try {
      guard_->Execute(ctx, [&](db::Transaction&) { ApplyTransition(ctx, record.tenant_id, record.case_id, request); });
      ++resumed;
    } catch (const util::ConcurrentModification& e) {
      // a user acted on the case between the scan and the update; next sweep re-evaluates it
      CASETRACK_LOG_WARN("case resume skipped", {observability::StringField("tenant", record.tenant_id),
                                                 observability::StringField("case", record.case_id), observability::StringField("error", e.what())});
    } catch (const util::InvalidTransition& e) {
      CASETRACK_LOG_WARN("case resume skipped", {observability::StringField("tenant", record.tenant_id),
                                                 observability::StringField("case", record.case_id), observability::StringField("error", e.what())});
    }
  }

  if (resumed > 0) {
    CASETRACK_LOG_INFO("parked cases resumed", {observability::IntField("count", static_cast<int64_t>(resumed))});
  }
  return resumed;
}

} // namespace casetrack::lifecycle
