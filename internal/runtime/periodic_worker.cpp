#include "periodic_worker.hpp"

#include "internal/observability/logging.hpp"

namespace casetrack::runtime {

PeriodicWorker::PeriodicWorker(std::string name, std::chrono::milliseconds interval, Task task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {
}

PeriodicWorker::~PeriodicWorker() {
  Stop();
}

void PeriodicWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&PeriodicWorker::Run, this);
  CASETRACK_LOG_INFO("worker started", {observability::StringField("worker", name_), observability::IntField("interval_ms", interval_.count())});
}

void PeriodicWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  CASETRACK_LOG_INFO("worker stopped", {observability::StringField("worker", name_)});
}

bool PeriodicWorker::RunOnce() {
  ++runs_;
  try {
    task_();
    return true;
  } catch (const std::exception& e) {
    ++failures_;
    CASETRACK_LOG_ERROR("worker run failed", {observability::StringField("worker", name_), observability::StringField("error", e.what())});
    return false;
  }
}

void PeriodicWorker::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
      break;
    }

    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

} // namespace casetrack::runtime
