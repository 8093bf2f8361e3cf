#include "internal/grpc/grpc_error.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace {

using casetrack::grpc::ToStatus;
using ::grpc::StatusCode;

template <typename E>
StatusCode CodeFor(const E& error) {
  return ToStatus(error).error_code();
}

void TestClientErrors() {
  using namespace casetrack::util;

  assert(CodeFor(FingerprintConflict("key reused")) == StatusCode::ALREADY_EXISTS);
  assert(CodeFor(InvalidTransition("RESOLVED is terminal", "RESOLVED")) == StatusCode::FAILED_PRECONDITION);
  assert(CodeFor(MissingAnnotation("comment required")) == StatusCode::FAILED_PRECONDITION);
  assert(CodeFor(MissingField("resume_at required", "resume_at")) == StatusCode::FAILED_PRECONDITION);
  assert(CodeFor(InvalidArgument("bad id")) == StatusCode::INVALID_ARGUMENT);
  assert(CodeFor(Forbidden("not the holder")) == StatusCode::PERMISSION_DENIED);
  assert(CodeFor(NotFound("no case")) == StatusCode::NOT_FOUND);
}

void TestContentionErrorsAreRetryable() {
  using namespace casetrack::util;

  assert(CodeFor(IdempotencyInProgress("pending")) == StatusCode::ABORTED);
  assert(CodeFor(ConcurrentModification("stale version")) == StatusCode::ABORTED);
  assert(CodeFor(LockConflict("locked", "alice", 1, 2)) == StatusCode::ABORTED);
}

void TestInfrastructureErrors() {
  using namespace casetrack::util;

  assert(CodeFor(StoreUnavailable("db down")) == StatusCode::UNAVAILABLE);
  assert(CodeFor(DependencyUnavailable("circuit open", "document-store")) == StatusCode::UNAVAILABLE);
  assert(CodeFor(DeadlineExceeded("too slow")) == StatusCode::DEADLINE_EXCEEDED);
}

void TestProgrammerErrorsAreInternal() {
  using namespace casetrack::util;

  assert(CodeFor(NoActiveTransaction("no unit of work")) == StatusCode::INTERNAL);
  assert(CodeFor(InvalidState("finalized twice")) == StatusCode::INTERNAL);
  assert(CodeFor(std::runtime_error("boom")) == StatusCode::INTERNAL);
}

void TestMessageIsPreserved() {
  const auto status = ToStatus(casetrack::util::LockConflict("case CASE-20251009-00001 is locked by alice", "alice", 1, 2));
  assert(status.error_message() == "case CASE-20251009-00001 is locked by alice");
}

} // namespace

int main() {
  TestClientErrors();
  TestContentionErrorsAreRetryable();
  TestInfrastructureErrors();
  TestProgrammerErrorsAreInternal();
  TestMessageIsPreserved();

  std::cout << "casetrack_unit_grpc_status: pass\n";
  return 0;
}
