#include "avlink/control_plane.h"

namespace avlink {
namespace {

void InheritLogCallback(const LogCallback& fallback, LogCallback* target) {
  if (!*target && fallback) {
    *target = fallback;
  }
}

}  // namespace

bool ControlPlaneConfig::Validate(std::string* error) const {
  std::string detail;
  auto fail = [&](const char* section) {
    if (error) {
      *error = std::string(section) + "." + detail;
    }
    return false;
  };
  if (!registry.Validate(&detail)) {
    return fail("registry");
  }
  if (!telemetry.Validate(&detail)) {
    return fail("telemetry");
  }
  if (!health.Validate(&detail)) {
    return fail("health");
  }
  if (!cec.Validate(&detail)) {
    return fail("cec");
  }
  return true;
}

ControlPlane::ControlPlane(ControlPlaneConfig config, const DeviceDirectory& directory,
                           ConnectionRegistry::ClientFactory factory)
    : config_(std::move(config)), directory_(directory) {
  InheritLogCallback(config_.log_callback, &config_.registry.log_callback);
  InheritLogCallback(config_.log_callback, &config_.registry.client_options.log_callback);
  InheritLogCallback(config_.log_callback, &config_.telemetry.log_callback);
  InheritLogCallback(config_.log_callback, &config_.health.log_callback);
  InheritLogCallback(config_.log_callback, &config_.cec.log_callback);

  cache_.reset(new CacheManager());
  scheduler_.reset(new TaskScheduler(config_.log_callback));
  registry_.reset(new ConnectionRegistry(config_.registry, std::move(factory)));
  telemetry_.reset(new TelemetryManager(config_.telemetry, *registry_, *cache_, directory_));
  health_.reset(new HealthMonitor(config_.health, *registry_, directory_, *scheduler_));
  cec_.reset(new CecControlService(config_.cec, *registry_, directory_));
}

ControlPlane::~ControlPlane() { Stop(); }

bool ControlPlane::Start() {
  if (running_) {
    return true;
  }
  std::string error;
  if (!config_.Validate(&error)) {
    last_error_ = "invalid config: " + error;
    Logger("control_plane", config_.log_callback).Error("start", last_error_);
    return false;
  }
  bool ok = scheduler_->Start() && registry_->Start();
  if (ok && config_.enable_telemetry_refresh) {
    ok = telemetry_->Start();
    if (!ok) {
      last_error_ = telemetry_->GetLastError();
    }
  }
  if (ok && config_.enable_health_monitor) {
    ok = health_->Start();
    if (!ok) {
      last_error_ = health_->GetLastError();
    }
  }
  if (!ok) {
    if (last_error_.empty()) {
      last_error_ = registry_->GetLastError();
    }
    Stop();
    return false;
  }
  running_ = true;
  return true;
}

void ControlPlane::Stop() {
  // Workers first, then the pool they borrow from.
  health_->Stop();
  telemetry_->Stop();
  scheduler_->Stop();
  registry_->Stop();
  running_ = false;
}

}  // namespace avlink
