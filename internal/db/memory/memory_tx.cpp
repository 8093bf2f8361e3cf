#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace casetrack::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_lock_(repo.writer_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("memory transaction already finished");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  rolled_back_ = true;
  writer_lock_.unlock();
}

} // namespace casetrack::db::memory
