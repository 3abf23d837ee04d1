#pragma once

#include "avlink/connection_registry.h"
#include "avlink/device_directory.h"
#include "avlink/logging.h"
#include "avlink/scheduler.h"
#include "avlink/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace avlink {

class HealthMonitor;

#ifdef AVLINK_TESTING
namespace test {
void RunHealthCheck(HealthMonitor& monitor, const std::string& device_id);
void RunReconnectAttempt(HealthMonitor& monitor, const std::string& device_id);
}  // namespace test
#endif

enum class HealthState {
  kUnknown,
  kHealthy,
  kUnhealthy,
  kReconnecting,
  kFailed,  // reconnect attempts exhausted; needs ResetDevice
};

const char* HealthStateName(HealthState state);

/**
 * Liveness record for one device.
 */
struct HealthRecord {
  std::string device_id;
  HealthState state = HealthState::kUnknown;
  bool is_healthy = false;
  std::chrono::steady_clock::time_point last_check;
  /// Failed checks since the last success.
  int consecutive_failures = 0;
  /// Reconnect attempts scheduled since the last success.
  int reconnect_attempts = 0;
  /// Delay before the pending reconnect attempt (zero when none).
  std::chrono::milliseconds next_backoff{0};
  Status last_error;
  /// Set on the first failure after a success, cleared on success.
  std::optional<std::chrono::steady_clock::time_point> down_since;
  uint64_t total_checks = 0;
  uint64_t total_failures = 0;
};

/**
 * Emitted on every state transition.
 */
struct HealthEvent {
  std::string device_id;
  HealthState from = HealthState::kUnknown;
  HealthState to = HealthState::kUnknown;
  /// Delay of the scheduled attempt when `to` is kReconnecting.
  std::chrono::milliseconds backoff{0};
  int attempt = 0;
  Status error;
};

struct HealthStatistics {
  size_t total = 0;
  size_t unknown = 0;
  size_t healthy = 0;
  size_t unhealthy = 0;
  size_t reconnecting = 0;
  size_t failed = 0;
};

struct HealthConfig {
  /// Period of the background check pass.
  std::chrono::milliseconds check_interval{30000};
  /// Delay before the first reconnect attempt.
  std::chrono::milliseconds initial_backoff{1000};
  /// Growth factor between consecutive attempts.
  double backoff_multiplier = 2.0;
  /// Upper bound of the reconnect delay.
  std::chrono::milliseconds max_backoff{30000};
  /// Attempts before a device is marked failed. Zero retries forever.
  int max_reconnect_attempts = 10;
  /// Optional structured log sink (defaults to stderr).
  LogCallback log_callback;
  LogLevel log_level = LogLevel::kInfo;

  bool Validate(std::string* error = nullptr) const;
};

/// Delay before reconnect attempt `attempt` (1-based): initial * multiplier^(attempt-1), capped.
std::chrono::milliseconds ComputeBackoff(const HealthConfig& config, int attempt);

/**
 * Periodic liveness checks with reconnect and exponential backoff.
 *
 * A check borrows the device connection from the registry, pings, and
 * releases it before returning. Reconnect attempts are scheduler tasks; Stop
 * cancels all of them. The monitor never owns or closes connections.
 */
class HealthMonitor {
 public:
  using EventCallback = std::function<void(const HealthEvent&)>;

  HealthMonitor(HealthConfig config, ConnectionRegistry& registry,
                const DeviceDirectory& directory, TaskScheduler& scheduler);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  bool Start();
  /// Stop periodic checks and cancel pending reconnect attempts. Blocks until
  /// an attempt already running on the scheduler finishes, so it must not be
  /// called from the event callback.
  void Stop();

  /// Check every device now, including failed ones.
  void ForceHealthCheck();
  std::optional<HealthRecord> GetHealthStatus(const std::string& device_id) const;
  std::vector<HealthRecord> GetAllHealthStatus() const;
  HealthStatistics GetStatistics() const;
  /// Move a failed device back to kUnknown. Returns false if it was not failed.
  bool ResetDevice(const std::string& device_id);

  void SetEventCallback(EventCallback cb);
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef AVLINK_TESTING
  friend void test::RunHealthCheck(HealthMonitor& monitor, const std::string& device_id);
  friend void test::RunReconnectAttempt(HealthMonitor& monitor,
                                        const std::string& device_id);
#endif
};

}  // namespace avlink
