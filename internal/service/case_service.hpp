#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/audit_event.hpp"
#include "internal/db/model/case_record.hpp"
#include "mutation_executor.hpp"
#include "service_context.hpp"

namespace casetrack::service {

/*
  Case workflow handlers.

  Every mutation runs through MutationExecutor, so each is idempotent per
  key, transactional, and audited. Transitions are refused with
  LockConflict while another user holds a live lock on the case.

  Responses carry a JSON body describing the case or lock.
*/
class CaseService {
 public:
  explicit CaseService(ServiceContext ctx);

  Response CreateCase(RequestMeta meta, const std::string& title);

  Response Open(RequestMeta meta, const std::string& case_id);
  Response Resolve(RequestMeta meta, const std::string& case_id, const std::string& comment);
  Response Pend(RequestMeta meta, const std::string& case_id, const std::string& comment, const std::string& resume_at);
  Response File(RequestMeta meta, const std::string& case_id, const std::string& comment);

  Response Lock(RequestMeta meta, const std::string& case_id);
  Response Unlock(RequestMeta meta, const std::string& case_id);
  Response Heartbeat(RequestMeta meta, const std::string& case_id);

  std::optional<db::model::CaseRecord> GetCase(const std::string& tenant_id, const std::string& case_id);
  std::vector<db::model::AuditEvent>   History(const std::string& tenant_id, const std::string& case_id);

 private:
  Response Transition(RequestMeta meta, const std::string& case_id, const std::string& to, const std::string& comment,
                      const std::string& resume_at);

  ServiceContext ctx_;
};

} // namespace casetrack::service
