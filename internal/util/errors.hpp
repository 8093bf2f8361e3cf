#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace casetrack::util {

/*
  Central error types.

  These get translated later to gRPC status codes (internal/grpc/grpc_error).

  Client errors:      the caller must change the request.
  Contention errors:  the caller may retry the same request.
  Fatal errors:       a defect in calling code, never swallowed.
  Infrastructure:     the backing store or a dependency is unavailable.
*/

// ---------------------------------------------------------------------
// Client errors
// ---------------------------------------------------------------------

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FingerprintConflict : public std::runtime_error {
 public:
  explicit FingerprintConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  InvalidTransition(const std::string& msg, std::string current_state)
      : std::runtime_error(msg), current_state_(std::move(current_state)) {
  }

  const std::string& current_state() const {
    return current_state_;
  }

 private:
  std::string current_state_;
};

class MissingAnnotation : public std::runtime_error {
 public:
  explicit MissingAnnotation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingField : public std::runtime_error {
 public:
  MissingField(const std::string& msg, std::string field) : std::runtime_error(msg), field_(std::move(field)) {
  }

  const std::string& field() const {
    return field_;
  }

 private:
  std::string field_;
};

class Forbidden : public std::runtime_error {
 public:
  explicit Forbidden(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Carries enough of the current lock for the client to decide whether to retry.
class LockConflict : public std::runtime_error {
 public:
  LockConflict(const std::string& msg, std::string holder, std::uint64_t acquired_at_ms, std::uint64_t last_activity_at_ms)
      : std::runtime_error(msg),
        holder_(std::move(holder)),
        acquired_at_ms_(acquired_at_ms),
        last_activity_at_ms_(last_activity_at_ms) {
  }

  const std::string& holder() const {
    return holder_;
  }
  std::uint64_t acquired_at_ms() const {
    return acquired_at_ms_;
  }
  std::uint64_t last_activity_at_ms() const {
    return last_activity_at_ms_;
  }

 private:
  std::string   holder_;
  std::uint64_t acquired_at_ms_;
  std::uint64_t last_activity_at_ms_;
};

// ---------------------------------------------------------------------
// Contention errors
// ---------------------------------------------------------------------

class IdempotencyInProgress : public std::runtime_error {
 public:
  explicit IdempotencyInProgress(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConcurrentModification : public std::runtime_error {
 public:
  explicit ConcurrentModification(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Fatal errors
// ---------------------------------------------------------------------

class NoActiveTransaction : public std::logic_error {
 public:
  explicit NoActiveTransaction(const std::string& msg) : std::logic_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Infrastructure errors
// ---------------------------------------------------------------------

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DependencyUnavailable : public std::runtime_error {
 public:
  DependencyUnavailable(const std::string& msg, std::string dependency)
      : std::runtime_error(msg), dependency_(std::move(dependency)) {
  }

  const std::string& dependency() const {
    return dependency_;
  }

 private:
  std::string dependency_;
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace casetrack::util
