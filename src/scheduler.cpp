#include "avlink/scheduler.h"

#include <algorithm>

namespace avlink {
namespace {

// Heap order: earliest due first, then submission order.
struct LaterThan {
  template <typename T>
  bool operator()(const T& a, const T& b) const {
    if (a.due != b.due) {
      return a.due > b.due;
    }
    return a.sequence > b.sequence;
  }
};

}  // namespace

void ScheduledTask::Cancel() {
  if (token_) {
    token_->store(true);
  }
}

bool ScheduledTask::cancelled() const { return token_ && token_->load(); }

TaskScheduler::TaskScheduler(LogCallback log_callback)
    : logger_("scheduler", std::move(log_callback)) {}

TaskScheduler::~TaskScheduler() { Stop(); }

bool TaskScheduler::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return true;
  }
  running_ = true;
  try {
    worker_ = std::thread([this]() { WorkerLoop(); });
  } catch (const std::exception& ex) {
    running_ = false;
    logger_.Error("start", std::string("thread start failed: ") + ex.what());
    return false;
  }
  return true;
}

void TaskScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    for (auto& item : queue_) {
      item.token->store(true);
    }
    queue_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

bool TaskScheduler::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

ScheduledTask TaskScheduler::Schedule(std::chrono::milliseconds delay, Task task) {
  auto token = std::make_shared<std::atomic<bool>>(false);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      token->store(true);
      return ScheduledTask(token);
    }
    Item item;
    item.due = std::chrono::steady_clock::now() + delay;
    item.sequence = next_sequence_++;
    item.token = token;
    item.task = std::move(task);
    queue_.push_back(std::move(item));
    std::push_heap(queue_.begin(), queue_.end(), LaterThan());
  }
  cv_.notify_all();
  return ScheduledTask(token);
}

size_t TaskScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void TaskScheduler::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (queue_.empty()) {
      cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
      continue;
    }
    const auto due = queue_.front().due;
    if (std::chrono::steady_clock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }
    std::pop_heap(queue_.begin(), queue_.end(), LaterThan());
    Item item = std::move(queue_.back());
    queue_.pop_back();
    if (item.token->load()) {
      continue;
    }
    lock.unlock();
    try {
      item.task();
    } catch (const std::exception& ex) {
      logger_.Error("task", std::string("scheduled task threw: ") + ex.what());
    }
    lock.lock();
  }
}

}  // namespace avlink
