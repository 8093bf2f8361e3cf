#include "mutation_executor.hpp"

#include "internal/idempotency/fingerprint.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace casetrack::service {

MutationExecutor::MutationExecutor(std::shared_ptr<idempotency::IdempotencyCoordinator> coordinator, std::shared_ptr<txn::TransactionGuard> guard,
                                   util::ClockFn clock, std::shared_ptr<breaker::CircuitBreaker> breakers)
    : coordinator_(std::move(coordinator)), guard_(std::move(guard)), clock_(std::move(clock)), breakers_(std::move(breakers)) {
}

Response MutationExecutor::Run(const RequestMeta& meta, const Handler& handler) {
  if (meta.tenant_id.empty() || meta.actor.empty()) {
    throw util::InvalidArgument("request requires tenant and actor");
  }

  if (breakers_ && !meta.skip_transaction) {
    const auto open = breakers_->OpenDependencies();
    if (!open.empty()) {
      CASETRACK_LOG_WARN("mutation refused, system degraded", {observability::StringField("correlation_id", meta.correlation_id),
                                                              observability::StringField("operation", meta.operation),
                                                              observability::StringField("dependency", open.front())});
      throw util::DependencyUnavailable("system degraded: dependency " + open.front() + " is unavailable", open.front());
    }
  }

  const auto fingerprint = idempotency::ComputeFingerprint(meta.operation, meta.resource_path, meta.body);
  auto       reservation = coordinator_->Reserve(meta.tenant_id, meta.actor, meta.idempotency_key, fingerprint);
  if (reservation.IsReplay()) {
    return *reservation.replay;
  }

  const auto started  = clock_();
  const auto deadline = meta.timeout ? std::optional<util::TimePoint>(started + *meta.timeout) : std::nullopt;

  txn::TransactionContext ctx;
  ctx.skipped = meta.skip_transaction;

  Response response;
  try {
    response = guard_->Execute(ctx, [&](db::Transaction&) {
      Response out = handler(ctx);
      if (deadline && clock_() > *deadline) {
        throw util::DeadlineExceeded(meta.operation + " exceeded its deadline");
      }
      return out;
    });
  } catch (const std::exception& e) {
    CASETRACK_LOG_WARN("mutation failed", {observability::StringField("correlation_id", meta.correlation_id),
                                           observability::StringField("operation", meta.operation), observability::StringField("error", e.what())});
    try {
      coordinator_->Finalize(reservation.token, false, {});
    } catch (const std::exception& finalize_error) {
      CASETRACK_LOG_ERROR("idempotency finalize failed", {observability::StringField("correlation_id", meta.correlation_id),
                                                          observability::StringField("error", finalize_error.what())});
    }
    throw;
  }

  coordinator_->Finalize(reservation.token, ctx.committed, response);

  const auto elapsed = std::chrono::duration<double, std::milli>(clock_() - started).count();
  observability::Metrics::Instance().ObserveMutationLatencyMs(meta.operation, ctx.committed, elapsed);
  return response;
}

} // namespace casetrack::service
