#include "internal/lifecycle/state_machine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lifecycle/case_lifecycle.hpp"
#include "internal/lock/entity_lock_manager.hpp"
#include "internal/util/errors.hpp"

namespace {

using casetrack::db::memory::MemoryRepository;
using casetrack::db::model::CaseRecord;
using casetrack::lifecycle::BuildCaseTransitionTable;
using casetrack::lifecycle::CaseLifecycle;
using casetrack::lifecycle::ParseResumeAt;
using casetrack::lifecycle::StateMachine;
using casetrack::lifecycle::TransitionRequest;
using casetrack::txn::TransactionContext;
using casetrack::txn::TransactionGuard;
namespace status = casetrack::lifecycle::case_status;

TransitionRequest Request(const std::string& to, const std::string& annotation = {}, const std::string& actor = "alice") {
  TransitionRequest request;
  request.to         = to;
  request.annotation = annotation;
  request.actor      = actor;
  return request;
}

StateMachine CaseMachine() {
  return StateMachine("case", BuildCaseTransitionTable(), casetrack::lock::kSystemActor);
}

void TestLegalEdges() {
  const auto machine = CaseMachine();

  machine.AssertTransition(status::kUnassigned, status::kOpen);
  machine.AssertTransition(status::kOpen, status::kResolved);
  machine.AssertTransition(status::kOpen, status::kFiled);
  machine.AssertTransition(status::kUnassigned, status::kPended);
  machine.AssertTransition(status::kPended, status::kOpen);

  assert(machine.Table().IsTerminal(status::kResolved));
  assert(machine.Table().IsTerminal(status::kFiled));
  assert(!machine.Table().IsTerminal(status::kOpen));
}

void TestIllegalEdgesCarryCurrentState() {
  const auto machine = CaseMachine();

  bool terminal = false;
  try {
    machine.AssertTransition(status::kResolved, status::kResolved);
  } catch (const casetrack::util::InvalidTransition& e) {
    terminal = e.current_state() == status::kResolved;
  }
  assert(terminal);

  bool self_edge = false;
  try {
    machine.AssertTransition(status::kOpen, status::kOpen);
  } catch (const casetrack::util::InvalidTransition& e) {
    self_edge = e.current_state() == status::kOpen;
  }
  assert(self_edge);

  bool unknown = false;
  try {
    machine.AssertTransition(status::kOpen, "ARCHIVED");
  } catch (const casetrack::util::InvalidArgument&) {
    unknown = true;
  }
  assert(unknown);
}

void TestAnnotationAndFieldRules() {
  const auto machine = CaseMachine();

  bool blank = false;
  try {
    machine.Check(status::kOpen, Request(status::kResolved, "   \t"));
  } catch (const casetrack::util::MissingAnnotation&) {
    blank = true;
  }
  assert(blank);

  machine.Check(status::kOpen, Request(status::kResolved, "customer confirmed"));

  bool missing_field = false;
  try {
    machine.Check(status::kOpen, Request(status::kPended, "waiting on documents"));
  } catch (const casetrack::util::MissingField& e) {
    missing_field = e.field() == casetrack::lifecycle::kResumeAtField;
  }
  assert(missing_field);

  auto pend = Request(status::kPended, "waiting on documents");
  pend.fields[casetrack::lifecycle::kResumeAtField] = "2025-10-10";
  machine.Check(status::kOpen, pend);
}

void TestResumeEdgeIsSystemOnly() {
  const auto machine = CaseMachine();

  bool threw = false;
  try {
    machine.Check(status::kPended, Request(status::kOpen));
  } catch (const casetrack::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);

  machine.Check(status::kPended, Request(status::kOpen, {}, casetrack::lock::kSystemActor));
}

void TestParseResumeAt() {
  // 08:00 Asia/Kolkata
  assert(ParseResumeAt("2025-10-10") == 1'760'063'400'000ULL);
  assert(ParseResumeAt("1760063400123") == 1'760'063'400'123ULL);

  bool threw = false;
  try {
    (void)ParseResumeAt("tomorrow");
  } catch (const casetrack::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  // 0 and pre-epoch dates would park a case where the resume sweep never finds it
  for (const char* value : {"0", "000", "1969-12-31", "1970-01-01"}) {
    threw = false;
    try {
      (void)ParseResumeAt(value);
    } catch (const casetrack::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw == (std::string(value) != "1970-01-01"));
  }
  assert(ParseResumeAt("1970-01-01") == 9'000'000ULL);
}

// Audit appends fail on demand; the transition must roll back with them.
class AuditFailingRepository : public MemoryRepository {
 public:
  casetrack::db::Result AppendAudit(casetrack::db::Transaction& tx, const casetrack::db::model::AuditEvent& event) override {
    if (fail_audit) {
      return casetrack::db::Result::Err(casetrack::db::ErrorCode::IOError, "audit sink offline");
    }
    return MemoryRepository::AppendAudit(tx, event);
  }

  bool fail_audit = false;
};

struct LifecycleFixture {
  std::shared_ptr<AuditFailingRepository> repo  = std::make_shared<AuditFailingRepository>();
  std::shared_ptr<TransactionGuard> guard = std::make_shared<TransactionGuard>(repo);
  CaseLifecycle                     lifecycle{repo, guard, [] { return casetrack::util::FromUnixMillis(1'760'000'000'000); }};

  void Seed(const std::string& case_id, const std::string& state) {
    TransactionContext ctx;
    guard->Execute(ctx, [&](casetrack::db::Transaction& tx) {
      CaseRecord record;
      record.tenant_id  = "tenant-a";
      record.case_id    = case_id;
      record.title      = "seeded";
      record.status     = state;
      record.version    = 1;
      record.created_by = "alice";
      casetrack::db::ThrowIfDbError(repo->InsertCase(tx, record), "seed case");
    });
  }

  CaseRecord Apply(const std::string& case_id, const TransitionRequest& request) {
    TransactionContext ctx;
    return guard->Execute(ctx, [&](casetrack::db::Transaction&) { return lifecycle.ApplyTransition(ctx, "tenant-a", case_id, request); });
  }

  CaseRecord Load(const std::string& case_id) {
    TransactionContext ctx;
    ctx.skipped = true;
    return guard->Execute(ctx, [&](casetrack::db::Transaction& tx) { return *repo->GetCase(tx, "tenant-a", case_id); });
  }
};

void TestApplyTransitionWritesCaseAndAudit() {
  LifecycleFixture f;
  f.Seed("CASE-20251009-00001", status::kUnassigned);

  auto pend = Request(status::kPended, "waiting on documents");
  pend.fields[casetrack::lifecycle::kResumeAtField] = "2025-10-10";
  const auto parked = f.Apply("CASE-20251009-00001", pend);
  assert(parked.status == status::kPended);
  assert(parked.version == 2);
  assert(parked.resume_at_ms == 1'760'063'400'000ULL);
  assert(parked.parked_by == "alice");

  const auto stored = f.Load("CASE-20251009-00001");
  assert(stored.status == status::kPended);
  assert(stored.last_transition_actor == "alice");

  TransactionContext ctx;
  ctx.skipped      = true;
  const auto audit = f.guard->Execute(ctx, [&](casetrack::db::Transaction& tx) { return f.repo->ListAudit(tx, "tenant-a", "CASE-20251009-00001"); });
  assert(audit.size() == 1);
  assert(audit[0].kind == casetrack::db::model::audit_kind::kTransition);
  assert(audit[0].from_state == status::kUnassigned);
  assert(audit[0].to_state == status::kPended);
  assert(audit[0].annotation == "waiting on documents");
}

void TestRejectedTransitionLeavesCaseUnchanged() {
  LifecycleFixture f;
  f.Seed("CASE-20251009-00002", status::kOpen);

  bool threw = false;
  try {
    f.Apply("CASE-20251009-00002", Request(status::kResolved));
  } catch (const casetrack::util::MissingAnnotation&) {
    threw = true;
  }
  assert(threw);

  const auto stored = f.Load("CASE-20251009-00002");
  assert(stored.status == status::kOpen);
  assert(stored.version == 1);
}

void TestZeroResumeAtIsRejected() {
  LifecycleFixture f;
  f.Seed("CASE-20251009-00003", status::kOpen);

  auto pend = Request(status::kPended, "waiting on customer");
  pend.fields[casetrack::lifecycle::kResumeAtField] = "0";

  bool threw = false;
  try {
    f.Apply("CASE-20251009-00003", pend);
  } catch (const casetrack::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  const auto stored = f.Load("CASE-20251009-00003");
  assert(stored.status == status::kOpen);
  assert(stored.version == 1);
  assert(stored.resume_at_ms == 0);
}

void TestAuditFailureRollsBackTransition() {
  LifecycleFixture f;
  f.Seed("CASE-20251009-00004", status::kOpen);
  f.repo->fail_audit = true;

  bool threw = false;
  try {
    f.Apply("CASE-20251009-00004", Request(status::kResolved, "fixed by restart"));
  } catch (const casetrack::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);

  f.repo->fail_audit = false;
  const auto stored  = f.Load("CASE-20251009-00004");
  assert(stored.status == status::kOpen);
  assert(stored.version == 1);
  assert(stored.last_transition_actor.empty());

  TransactionContext ctx;
  ctx.skipped = true;
  assert(f.guard->Execute(ctx, [&](casetrack::db::Transaction& tx) { return f.repo->ListAudit(tx, "tenant-a", "CASE-20251009-00004"); }).empty());
}

void TestMissingCaseIsNotFound() {
  LifecycleFixture f;

  bool threw = false;
  try {
    f.Apply("CASE-20251009-00099", Request(status::kOpen));
  } catch (const casetrack::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestTransitionOutsideUnitOfWorkIsRefused() {
  LifecycleFixture   f;
  TransactionContext ctx;

  bool threw = false;
  try {
    f.lifecycle.ApplyTransition(ctx, "tenant-a", "CASE-20251009-00001", Request(status::kOpen));
  } catch (const casetrack::util::NoActiveTransaction&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLegalEdges();
  TestIllegalEdgesCarryCurrentState();
  TestAnnotationAndFieldRules();
  TestResumeEdgeIsSystemOnly();
  TestParseResumeAt();
  TestApplyTransitionWritesCaseAndAudit();
  TestRejectedTransitionLeavesCaseUnchanged();
  TestZeroResumeAtIsRejected();
  TestAuditFailureRollsBackTransition();
  TestMissingCaseIsNotFound();
  TestTransitionOutsideUnitOfWorkIsRefused();

  std::cout << "casetrack_unit_state_machine: pass\n";
  return 0;
}
