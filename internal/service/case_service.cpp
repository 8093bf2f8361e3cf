#include "case_service.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "case_id.hpp"
#include "internal/lifecycle/case_lifecycle.hpp"
#include "internal/lock/entity_lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sequence/sequence_counter.hpp"
#include "internal/util/errors.hpp"

namespace casetrack::service {

namespace {

using google::protobuf::Struct;

constexpr int kOk      = 200;
constexpr int kCreated = 201;

std::string ToJson(const Struct& body) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode response: " + std::string(status.message()));
  }
  return json;
}

void Set(Struct& s, const std::string& key, const std::string& value) {
  (*s.mutable_fields())[key].set_string_value(value);
}

void Set(Struct& s, const std::string& key, uint64_t value) {
  (*s.mutable_fields())[key].set_number_value(static_cast<double>(value));
}

Struct CaseBody(const db::model::CaseRecord& record) {
  Struct body;
  Set(body, "caseId", record.case_id);
  Set(body, "title", record.title);
  Set(body, "status", record.status);
  Set(body, "version", record.version);
  if (record.resume_at_ms != 0) {
    Set(body, "resumeAtMs", record.resume_at_ms);
    Set(body, "parkedBy", record.parked_by);
  }
  return body;
}

Struct LockBody(const db::model::EntityLockRecord& lock) {
  Struct body;
  Set(body, "caseId", lock.entity_id);
  Set(body, "holder", lock.holder);
  Set(body, "acquiredAtMs", lock.acquired_at_ms);
  Set(body, "lastActivityAtMs", lock.last_activity_at_ms);
  return body;
}

// Requests without a caller-supplied body are fingerprinted over their arguments.
void DefaultBody(RequestMeta& meta, const Struct& args) {
  if (meta.body.empty()) {
    meta.body = ToJson(args);
  }
}

void RequireCaseId(const std::string& case_id) {
  if (!IsValidCaseId(case_id)) {
    throw util::InvalidArgument("malformed case id '" + case_id + "'");
  }
}

} // namespace

CaseService::CaseService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Response CaseService::CreateCase(RequestMeta meta, const std::string& title) {
  if (lifecycle::IsBlank(title)) {
    throw util::InvalidArgument("case title is required");
  }

  Struct args;
  Set(args, "title", title);
  DefaultBody(meta, args);
  if (meta.operation.empty()) meta.operation = "case.create";
  if (meta.resource_path.empty()) meta.resource_path = "/cases";

  return ctx_.executor->Run(meta, [&](txn::TransactionContext& tctx) {
    auto&          tx  = ctx_.guard->RequireActive(tctx, "create case");
    const auto     now = ctx_.clock();
    const uint64_t ms  = util::ToUnixMillis(now);

    sequence::ScopeKey scope{meta.tenant_id, kCaseDomain, util::FormatDay(now)};
    const auto         n = ctx_.sequence->Next(tctx, scope);

    db::model::CaseRecord record;
    record.tenant_id     = meta.tenant_id;
    record.case_id       = FormatCaseId(scope.day, n);
    record.title         = title;
    record.status        = lifecycle::case_status::kUnassigned;
    record.version       = 1;
    record.created_by    = meta.actor;
    record.created_at_ms = ms;

    auto inserted = ctx_.repository->InsertCase(tx, record);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      throw util::InvalidState("case id " + record.case_id + " issued twice");
    }
    db::ThrowIfDbError(inserted, "insert case");

    db::model::AuditEvent event;
    event.tenant_id = meta.tenant_id;
    event.entity_id = record.case_id;
    event.kind      = db::model::audit_kind::kCaseCreated;
    event.to_state  = record.status;
    event.actor     = meta.actor;
    event.at_ms     = ms;
    db::ThrowIfDbError(ctx_.repository->AppendAudit(tx, event), "append case audit event");

    CASETRACK_LOG_INFO("case created", {observability::StringField("tenant", meta.tenant_id), observability::StringField("case", record.case_id),
                                        observability::StringField("correlation_id", meta.correlation_id)});
    return Response{kCreated, ToJson(CaseBody(record))};
  });
}

Response CaseService::Transition(RequestMeta meta, const std::string& case_id, const std::string& to, const std::string& comment,
                                 const std::string& resume_at) {
  RequireCaseId(case_id);

  Struct args;
  Set(args, "caseId", case_id);
  Set(args, "status", to);
  if (!comment.empty()) Set(args, "comment", comment);
  if (!resume_at.empty()) Set(args, "resumeAt", resume_at);
  DefaultBody(meta, args);
  if (meta.operation.empty()) meta.operation = "case.transition." + to;
  if (meta.resource_path.empty()) meta.resource_path = "/cases/" + case_id;

  return ctx_.executor->Run(meta, [&](txn::TransactionContext& tctx) {
    ctx_.locks->EnsureNotLockedByOther(tctx, meta.tenant_id, case_id, meta.actor);

    lifecycle::TransitionRequest request;
    request.to         = to;
    request.annotation = comment;
    request.actor      = meta.actor;
    if (!resume_at.empty()) request.fields[lifecycle::kResumeAtField] = resume_at;

    auto updated = ctx_.lifecycle->ApplyTransition(tctx, meta.tenant_id, case_id, request);
    return Response{kOk, ToJson(CaseBody(updated))};
  });
}

Response CaseService::Open(RequestMeta meta, const std::string& case_id) {
  return Transition(std::move(meta), case_id, lifecycle::case_status::kOpen, {}, {});
}

Response CaseService::Resolve(RequestMeta meta, const std::string& case_id, const std::string& comment) {
  return Transition(std::move(meta), case_id, lifecycle::case_status::kResolved, comment, {});
}

Response CaseService::Pend(RequestMeta meta, const std::string& case_id, const std::string& comment, const std::string& resume_at) {
  return Transition(std::move(meta), case_id, lifecycle::case_status::kPended, comment, resume_at);
}

Response CaseService::File(RequestMeta meta, const std::string& case_id, const std::string& comment) {
  return Transition(std::move(meta), case_id, lifecycle::case_status::kFiled, comment, {});
}

Response CaseService::Lock(RequestMeta meta, const std::string& case_id) {
  RequireCaseId(case_id);

  Struct args;
  Set(args, "caseId", case_id);
  DefaultBody(meta, args);
  if (meta.operation.empty()) meta.operation = "case.lock";
  if (meta.resource_path.empty()) meta.resource_path = "/cases/" + case_id + "/lock";

  return ctx_.executor->Run(meta, [&](txn::TransactionContext& tctx) {
    auto& tx = ctx_.guard->RequireActive(tctx, "lock case");
    if (!ctx_.repository->GetCase(tx, meta.tenant_id, case_id)) {
      throw util::NotFound("case " + case_id + " not found");
    }

    auto result = ctx_.locks->Acquire(tctx, meta.tenant_id, case_id, meta.actor);
    auto body   = LockBody(result.lock);
    if (result.previous_holder) {
      Set(body, "autoReleasedFrom", *result.previous_holder);
    }
    return Response{kOk, ToJson(body)};
  });
}

Response CaseService::Unlock(RequestMeta meta, const std::string& case_id) {
  RequireCaseId(case_id);

  Struct args;
  Set(args, "caseId", case_id);
  DefaultBody(meta, args);
  if (meta.operation.empty()) meta.operation = "case.unlock";
  if (meta.resource_path.empty()) meta.resource_path = "/cases/" + case_id + "/unlock";

  return ctx_.executor->Run(meta, [&](txn::TransactionContext& tctx) {
    ctx_.locks->Release(tctx, meta.tenant_id, case_id, meta.actor);

    Struct body;
    Set(body, "caseId", case_id);
    (*body.mutable_fields())["released"].set_bool_value(true);
    return Response{kOk, ToJson(body)};
  });
}

Response CaseService::Heartbeat(RequestMeta meta, const std::string& case_id) {
  RequireCaseId(case_id);

  Struct args;
  Set(args, "caseId", case_id);
  DefaultBody(meta, args);
  if (meta.operation.empty()) meta.operation = "case.heartbeat";
  if (meta.resource_path.empty()) meta.resource_path = "/cases/" + case_id + "/heartbeat";

  return ctx_.executor->Run(meta, [&](txn::TransactionContext& tctx) {
    auto lock = ctx_.locks->Heartbeat(tctx, meta.tenant_id, case_id, meta.actor);
    return Response{kOk, ToJson(LockBody(lock))};
  });
}

std::optional<db::model::CaseRecord> CaseService::GetCase(const std::string& tenant_id, const std::string& case_id) {
  txn::TransactionContext tctx;
  tctx.skipped = true;
  return ctx_.guard->Execute(tctx, [&](db::Transaction& tx) { return ctx_.repository->GetCase(tx, tenant_id, case_id); });
}

std::vector<db::model::AuditEvent> CaseService::History(const std::string& tenant_id, const std::string& case_id) {
  txn::TransactionContext tctx;
  tctx.skipped = true;
  return ctx_.guard->Execute(tctx, [&](db::Transaction& tx) { return ctx_.repository->ListAudit(tx, tenant_id, case_id); });
}

} // namespace casetrack::service
