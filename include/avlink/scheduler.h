#pragma once

#include "avlink/logging.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace avlink {

/**
 * Handle to a scheduled task. Copies share one cancellation token.
 */
class ScheduledTask {
 public:
  ScheduledTask() = default;

  /// Prevent the task from running. No effect once it has started.
  void Cancel();
  bool cancelled() const;
  bool valid() const { return token_ != nullptr; }

 private:
  friend class TaskScheduler;
  explicit ScheduledTask(std::shared_ptr<std::atomic<bool>> token)
      : token_(std::move(token)) {}

  std::shared_ptr<std::atomic<bool>> token_;
};

/**
 * Runs delayed tasks on one worker thread, earliest deadline first.
 */
class TaskScheduler {
 public:
  using Task = std::function<void()>;

  explicit TaskScheduler(LogCallback log_callback = nullptr);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;

  bool Start();
  /// Stop the worker and drop every pending task.
  void Stop();
  bool running() const;

  /// Run `task` after `delay` unless cancelled first.
  ScheduledTask Schedule(std::chrono::milliseconds delay, Task task);
  size_t pending() const;

 private:
  struct Item {
    std::chrono::steady_clock::time_point due;
    uint64_t sequence = 0;
    std::shared_ptr<std::atomic<bool>> token;
    Task task;
  };

  void WorkerLoop();

  Logger logger_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Item> queue_;
  uint64_t next_sequence_ = 0;
  bool running_ = false;
  std::thread worker_;
};

}  // namespace avlink
