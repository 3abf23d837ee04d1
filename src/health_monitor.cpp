#include "avlink/health_monitor.h"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace avlink {
namespace {

using Clock = std::chrono::steady_clock;

enum class CheckKind {
  kPeriodic,   // skips failed devices and devices with a queued reconnect
  kForced,     // checks every device
  kReconnect,  // scheduled reconnect attempt
};

}  // namespace

const char* HealthStateName(HealthState state) {
  switch (state) {
    case HealthState::kUnknown:
      return "unknown";
    case HealthState::kHealthy:
      return "healthy";
    case HealthState::kUnhealthy:
      return "unhealthy";
    case HealthState::kReconnecting:
      return "reconnecting";
    case HealthState::kFailed:
      return "failed";
  }
  return "unknown";
}

bool HealthConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (check_interval.count() <= 0) {
    return fail("check_interval must be positive");
  }
  if (initial_backoff.count() <= 0 || max_backoff.count() <= 0) {
    return fail("backoff intervals must be positive");
  }
  if (max_backoff < initial_backoff) {
    return fail("max_backoff must be >= initial_backoff");
  }
  if (!(backoff_multiplier >= 1.0)) {
    return fail("backoff_multiplier must be >= 1");
  }
  if (max_reconnect_attempts < 0) {
    return fail("max_reconnect_attempts must not be negative");
  }
  return true;
}

std::chrono::milliseconds ComputeBackoff(const HealthConfig& config, int attempt) {
  if (attempt < 1) {
    attempt = 1;
  }
  const double initial = static_cast<double>(config.initial_backoff.count());
  const double cap = static_cast<double>(config.max_backoff.count());
  const double delay = initial * std::pow(config.backoff_multiplier, attempt - 1);
  if (!std::isfinite(delay) || delay >= cap) {
    return config.max_backoff;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

struct HealthMonitor::Impl {
  struct Entry {
    HealthRecord record;
    ScheduledTask pending;
    /// An attempt sits in the scheduler queue and has not started yet.
    bool attempt_queued = false;
    bool checking = false;
  };

  // Shared with scheduled attempts so a task that outlives Stop() never
  // touches a destroyed monitor. `impl` is null while stopped.
  struct AttemptGate {
    std::mutex mutex;
    std::condition_variable idle;
    Impl* impl = nullptr;
    int running = 0;
  };

  Impl(HealthConfig cfg, ConnectionRegistry& reg, const DeviceDirectory& dir,
       TaskScheduler& sched)
      : config(std::move(cfg)),
        registry(reg),
        directory(dir),
        scheduler(sched),
        logger("health", config.log_callback, config.log_level),
        gate(std::make_shared<AttemptGate>()) {
    gate->impl = this;
  }

  bool AttemptLive(const Entry& entry) const {
    return entry.attempt_queued && !entry.pending.cancelled();
  }

  Status Probe(const std::string& device_id) {
    auto endpoint = directory.Lookup(device_id);
    if (!endpoint.has_value()) {
      return Status(ErrorCode::kDeviceNotFound, "unknown device " + device_id);
    }
    ConnectionHandle handle;
    Status status = registry.Acquire(*endpoint, &handle);
    if (!status.ok()) {
      return status;
    }
    return handle->Ping();
  }

  void Transition(Entry& entry, HealthState to, std::vector<HealthEvent>* events) {
    HealthRecord& record = entry.record;
    if (record.state == to) {
      return;
    }
    HealthEvent event;
    event.device_id = record.device_id;
    event.from = record.state;
    event.to = to;
    event.attempt = record.reconnect_attempts;
    event.error = record.last_error;
    if (to == HealthState::kReconnecting) {
      event.backoff = record.next_backoff;
    }
    record.state = to;
    record.is_healthy = to == HealthState::kHealthy;
    events->push_back(event);
  }

  // Caller holds `mutex`.
  void ScheduleReconnectLocked(Entry& entry, std::vector<HealthEvent>* events) {
    HealthRecord& record = entry.record;
    if (config.max_reconnect_attempts > 0 &&
        record.reconnect_attempts >= config.max_reconnect_attempts) {
      record.next_backoff = std::chrono::milliseconds(0);
      Transition(entry, HealthState::kFailed, events);
      return;
    }
    if (stopped) {
      record.next_backoff = std::chrono::milliseconds(0);
      return;
    }
    record.reconnect_attempts++;
    record.next_backoff = ComputeBackoff(config, record.reconnect_attempts);
    Transition(entry, HealthState::kReconnecting, events);
    const std::string device_id = record.device_id;
    std::shared_ptr<AttemptGate> attempt_gate = gate;
    entry.attempt_queued = true;
    entry.pending = scheduler.Schedule(record.next_backoff, [attempt_gate, device_id]() {
      RunAttempt(attempt_gate, device_id);
    });
  }

  static void RunAttempt(const std::shared_ptr<AttemptGate>& attempt_gate,
                         const std::string& device_id) {
    Impl* impl = nullptr;
    {
      std::lock_guard<std::mutex> lock(attempt_gate->mutex);
      if (attempt_gate->impl == nullptr) {
        return;
      }
      impl = attempt_gate->impl;
      attempt_gate->running++;
    }
    impl->Check(device_id, CheckKind::kReconnect);
    std::lock_guard<std::mutex> lock(attempt_gate->mutex);
    attempt_gate->running--;
    attempt_gate->idle.notify_all();
  }

  void Check(const std::string& device_id, CheckKind kind) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      Entry& entry = entries[device_id];
      entry.record.device_id = device_id;
      if (kind == CheckKind::kReconnect) {
        // The attempt is spent whether it probes or not. A check already in
        // flight reschedules it on failure.
        entry.attempt_queued = false;
        if (stopped) {
          return;
        }
      }
      if (entry.checking) {
        return;
      }
      const HealthState state = entry.record.state;
      if (kind == CheckKind::kPeriodic &&
          (state == HealthState::kFailed ||
           (state == HealthState::kReconnecting && AttemptLive(entry)))) {
        return;
      }
      if (kind == CheckKind::kReconnect && state != HealthState::kReconnecting) {
        return;
      }
      entry.checking = true;
    }

    const Status status = Probe(device_id);
    const auto now = Clock::now();

    std::vector<HealthEvent> events;
    {
      std::lock_guard<std::mutex> lock(mutex);
      Entry& entry = entries[device_id];
      HealthRecord& record = entry.record;
      entry.checking = false;
      record.last_check = now;
      record.total_checks++;
      if (status.ok()) {
        entry.pending.Cancel();
        entry.attempt_queued = false;
        record.consecutive_failures = 0;
        record.reconnect_attempts = 0;
        record.next_backoff = std::chrono::milliseconds(0);
        record.last_error = Status::Ok();
        record.down_since.reset();
        Transition(entry, HealthState::kHealthy, &events);
      } else {
        record.total_failures++;
        record.consecutive_failures++;
        record.last_error = status;
        if (!record.down_since.has_value()) {
          record.down_since = now;
        }
        switch (record.state) {
          case HealthState::kFailed:
            break;
          case HealthState::kReconnecting:
            if (kind == CheckKind::kReconnect) {
              Transition(entry, HealthState::kUnhealthy, &events);
              ScheduleReconnectLocked(entry, &events);
            } else if (!AttemptLive(entry)) {
              // The queued attempt ran while this check was in flight.
              ScheduleReconnectLocked(entry, &events);
            }
            break;
          case HealthState::kUnknown:
          case HealthState::kHealthy:
          case HealthState::kUnhealthy:
            Transition(entry, HealthState::kUnhealthy, &events);
            ScheduleReconnectLocked(entry, &events);
            break;
        }
      }
    }
    Emit(events);
  }

  void Emit(const std::vector<HealthEvent>& events) {
    if (events.empty()) {
      return;
    }
    EventCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex);
      callback = event_callback;
    }
    for (const auto& event : events) {
      Logger::Fields fields = {{"device", event.device_id},
                               {"from", HealthStateName(event.from)},
                               {"to", HealthStateName(event.to)}};
      if (event.to == HealthState::kReconnecting) {
        fields.emplace_back("attempt", std::to_string(event.attempt));
        fields.emplace_back("backoff_ms", std::to_string(event.backoff.count()));
        logger.Info("reconnect_scheduled", "reconnect attempt scheduled", fields);
      } else if (event.to == HealthState::kFailed) {
        logger.Error("health", "reconnect attempts exhausted: " + event.error.ToString(),
                     fields);
      } else if (event.to == HealthState::kHealthy) {
        logger.Info("health", "device healthy", fields);
      } else {
        logger.Warn("health", event.error.ToString(), fields);
      }
      if (!callback) {
        continue;
      }
      try {
        callback(event);
      } catch (const std::exception& ex) {
        logger.Error("callback", std::string("health event callback threw: ") + ex.what(),
                     {{"device", event.device_id}});
      }
    }
  }

  // Forget devices that left the directory.
  void Prune(const std::vector<std::string>& device_ids) {
    const std::unordered_set<std::string> known(device_ids.begin(), device_ids.end());
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = entries.begin(); it != entries.end();) {
      if (known.count(it->first) == 0 && !it->second.checking) {
        it->second.pending.Cancel();
        it->second.attempt_queued = false;
        it = entries.erase(it);
      } else {
        ++it;
      }
    }
  }

  void RunPass(CheckKind kind) {
    const std::vector<std::string> device_ids = directory.ListDeviceIds();
    Prune(device_ids);
    for (const auto& device_id : device_ids) {
      Check(device_id, kind);
    }
  }

  void CheckLoop() {
    std::unique_lock<std::mutex> lock(run_mutex);
    while (running) {
      run_cv.wait_for(lock, config.check_interval, [this]() { return !running; });
      if (!running) {
        return;
      }
      lock.unlock();
      RunPass(CheckKind::kPeriodic);
      lock.lock();
    }
  }

  HealthConfig config;
  ConnectionRegistry& registry;
  const DeviceDirectory& directory;
  TaskScheduler& scheduler;
  Logger logger;

  std::shared_ptr<AttemptGate> gate;

  mutable std::mutex mutex;
  std::unordered_map<std::string, Entry> entries;
  /// Set by Stop(); no attempt is scheduled or run while set.
  bool stopped = false;

  std::mutex callback_mutex;
  EventCallback event_callback;

  std::mutex run_mutex;
  std::condition_variable run_cv;
  bool running = false;
  std::thread check_thread;
  std::string last_error;
};

HealthMonitor::HealthMonitor(HealthConfig config, ConnectionRegistry& registry,
                             const DeviceDirectory& directory, TaskScheduler& scheduler)
    : impl_(new Impl(std::move(config), registry, directory, scheduler)) {}

HealthMonitor::~HealthMonitor() { Stop(); }

bool HealthMonitor::Start() {
  std::lock_guard<std::mutex> lock(impl_->run_mutex);
  if (impl_->running) {
    return true;
  }
  std::string error;
  if (!impl_->config.Validate(&error)) {
    impl_->last_error = "invalid health config: " + error;
    impl_->logger.Error("start", impl_->last_error);
    return false;
  }
  {
    std::lock_guard<std::mutex> state_lock(impl_->mutex);
    impl_->stopped = false;
  }
  {
    std::lock_guard<std::mutex> gate_lock(impl_->gate->mutex);
    impl_->gate->impl = impl_.get();
  }
  impl_->running = true;
  try {
    impl_->check_thread = std::thread([this]() { impl_->CheckLoop(); });
  } catch (const std::exception& ex) {
    impl_->running = false;
    impl_->last_error = std::string("thread start failed: ") + ex.what();
    impl_->logger.Error("start", impl_->last_error);
    return false;
  }
  return true;
}

void HealthMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(impl_->run_mutex);
    impl_->running = false;
  }
  impl_->run_cv.notify_all();
  if (impl_->check_thread.joinable()) {
    impl_->check_thread.join();
  }
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stopped = true;
    for (auto& entry : impl_->entries) {
      entry.second.pending.Cancel();
      entry.second.attempt_queued = false;
    }
  }
  // Wait out an attempt already running on the scheduler thread.
  std::unique_lock<std::mutex> gate_lock(impl_->gate->mutex);
  impl_->gate->impl = nullptr;
  impl_->gate->idle.wait(gate_lock, [this]() { return impl_->gate->running == 0; });
}

void HealthMonitor::ForceHealthCheck() { impl_->RunPass(CheckKind::kForced); }

std::optional<HealthRecord> HealthMonitor::GetHealthStatus(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->entries.find(device_id);
  if (it == impl_->entries.end()) {
    return std::nullopt;
  }
  return it->second.record;
}

std::vector<HealthRecord> HealthMonitor::GetAllHealthStatus() const {
  std::vector<HealthRecord> records;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    records.reserve(impl_->entries.size());
    for (const auto& entry : impl_->entries) {
      records.push_back(entry.second.record);
    }
  }
  std::sort(records.begin(), records.end(),
            [](const HealthRecord& a, const HealthRecord& b) { return a.device_id < b.device_id; });
  return records;
}

HealthStatistics HealthMonitor::GetStatistics() const {
  HealthStatistics stats;
  std::lock_guard<std::mutex> lock(impl_->mutex);
  for (const auto& entry : impl_->entries) {
    stats.total++;
    switch (entry.second.record.state) {
      case HealthState::kUnknown:
        stats.unknown++;
        break;
      case HealthState::kHealthy:
        stats.healthy++;
        break;
      case HealthState::kUnhealthy:
        stats.unhealthy++;
        break;
      case HealthState::kReconnecting:
        stats.reconnecting++;
        break;
      case HealthState::kFailed:
        stats.failed++;
        break;
    }
  }
  return stats;
}

bool HealthMonitor::ResetDevice(const std::string& device_id) {
  std::vector<HealthEvent> events;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->entries.find(device_id);
    if (it == impl_->entries.end() || it->second.record.state != HealthState::kFailed) {
      return false;
    }
    HealthRecord& record = it->second.record;
    record.consecutive_failures = 0;
    record.reconnect_attempts = 0;
    record.next_backoff = std::chrono::milliseconds(0);
    record.last_error = Status::Ok();
    impl_->Transition(it->second, HealthState::kUnknown, &events);
  }
  impl_->Emit(events);
  return true;
}

void HealthMonitor::SetEventCallback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->event_callback = std::move(cb);
}

std::string HealthMonitor::GetLastError() const {
  std::lock_guard<std::mutex> lock(impl_->run_mutex);
  return impl_->last_error;
}

#ifdef AVLINK_TESTING
namespace test {

void RunHealthCheck(HealthMonitor& monitor, const std::string& device_id) {
  monitor.impl_->Check(device_id, CheckKind::kPeriodic);
}

void RunReconnectAttempt(HealthMonitor& monitor, const std::string& device_id) {
  monitor.impl_->Check(device_id, CheckKind::kReconnect);
}

}  // namespace test
#endif

}  // namespace avlink
