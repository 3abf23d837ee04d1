#pragma once

#include "avlink/cache_manager.h"
#include "avlink/cec_control_service.h"
#include "avlink/connection_registry.h"
#include "avlink/device_directory.h"
#include "avlink/health_monitor.h"
#include "avlink/logging.h"
#include "avlink/scheduler.h"
#include "avlink/telemetry_manager.h"

#include <memory>
#include <string>

namespace avlink {

/**
 * Configuration of the whole control plane.
 */
struct ControlPlaneConfig {
  RegistryConfig registry;
  TelemetryConfig telemetry;
  HealthConfig health;
  CecServiceConfig cec;
  /// Run the periodic health checks.
  bool enable_health_monitor = true;
  /// Run the telemetry refresh thread.
  bool enable_telemetry_refresh = true;
  /// When set, used for every component that has no sink of its own.
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Explicitly constructed composition of the device services.
 *
 * One instance per process in production, a fresh one per test. The device
 * directory is owned by the caller and must outlive the control plane.
 */
class ControlPlane {
 public:
  ControlPlane(ControlPlaneConfig config, const DeviceDirectory& directory,
               ConnectionRegistry::ClientFactory factory = nullptr);
  ~ControlPlane();

  ControlPlane(const ControlPlane&) = delete;
  ControlPlane& operator=(const ControlPlane&) = delete;

  /// Validate the configuration and start the background threads.
  bool Start();
  /// Stop every background thread and close all connections.
  void Stop();
  bool running() const { return running_; }
  std::string GetLastError() const { return last_error_; }

  CacheManager& cache() { return *cache_; }
  ConnectionRegistry& registry() { return *registry_; }
  TaskScheduler& scheduler() { return *scheduler_; }
  TelemetryManager& telemetry() { return *telemetry_; }
  HealthMonitor& health() { return *health_; }
  CecControlService& cec() { return *cec_; }
  const DeviceDirectory& directory() const { return directory_; }

 private:
  ControlPlaneConfig config_;
  const DeviceDirectory& directory_;
  bool running_ = false;
  std::string last_error_;

  // Declaration order is construction order; destruction runs in reverse,
  // so services go before the registry and scheduler they use.
  std::unique_ptr<CacheManager> cache_;
  std::unique_ptr<TaskScheduler> scheduler_;
  std::unique_ptr<ConnectionRegistry> registry_;
  std::unique_ptr<TelemetryManager> telemetry_;
  std::unique_ptr<HealthMonitor> health_;
  std::unique_ptr<CecControlService> cec_;
};

}  // namespace avlink
