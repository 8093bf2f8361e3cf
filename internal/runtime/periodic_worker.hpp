#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace casetrack::runtime {

/*
  Background worker that runs one task on a fixed interval.

  Used for:
      parked case resume sweep
      idempotency record retention sweep

  A failing run is logged and the worker keeps its schedule.
*/
class PeriodicWorker {
 public:
  using Task = std::function<void()>;

  PeriodicWorker(std::string name, std::chrono::milliseconds interval, Task task);
  ~PeriodicWorker();

  PeriodicWorker(const PeriodicWorker&)            = delete;
  PeriodicWorker& operator=(const PeriodicWorker&) = delete;

  void Start();
  void Stop();

  // Runs the task once on the calling thread.
  bool RunOnce();

  uint64_t Runs() const {
    return runs_.load();
  }
  uint64_t Failures() const {
    return failures_.load();
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  Task                      task_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       running_{false};

  std::atomic<uint64_t> runs_{0};
  std::atomic<uint64_t> failures_{0};
};

} // namespace casetrack::runtime
