#pragma once

#include "avlink/cache_manager.h"
#include "avlink/connection_registry.h"
#include "avlink/device_directory.h"
#include "avlink/logging.h"
#include "avlink/types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace avlink {

class TelemetryManager;

enum class ReadSource;

#ifdef AVLINK_TESTING
namespace test {
void RunTelemetryRefresh(TelemetryManager& manager,
                         std::chrono::steady_clock::time_point now);
/// Fetch as Read does after its cache lookup missed.
ReadSource LoadAfterCacheMiss(TelemetryManager& manager, const std::string& device_id,
                              const std::string& parameter);
}  // namespace test
#endif

/// Cache namespace holding fresh telemetry values.
constexpr const char* kTelemetryNamespace = "telemetry";
/// Cache namespace holding the last good value of each parameter.
constexpr const char* kTelemetryLastGoodNamespace = "telemetry.lastgood";

struct TelemetryConfig {
  /// Freshness window of a fetched value.
  std::chrono::milliseconds cache_ttl{2000};
  /// How long a last good value may be served after the device fails.
  std::chrono::milliseconds stale_bound{60000};
  /// Deactivate subscriptions nobody has read for this long.
  std::chrono::milliseconds retention{300000};
  /// Period of the background refresh pass.
  std::chrono::milliseconds refresh_interval{1000};
  /// Optional structured log sink (defaults to stderr).
  LogCallback log_callback;
  LogLevel log_level = LogLevel::kInfo;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Where a telemetry value came from.
 */
enum class ReadSource {
  kFresh,        // fetched from the device by this read
  kCached,       // served from the cache within its TTL
  kStale,        // device failed; last good value within the staleness bound
  kUnavailable,  // device failed and nothing recent is known
};

const char* ReadSourceName(ReadSource source);

struct TelemetryReading {
  ReadSource source = ReadSource::kUnavailable;
  ParamValue value;
  /// Error from the device when source is kStale or kUnavailable.
  Status error;

  bool has_value() const { return HasValue(value); }
};

struct SubscriptionInfo {
  std::string device_id;
  std::string parameter;
  ValueFormat format = ValueFormat::kVal;
  ParamValue last_value;
  std::chrono::steady_clock::time_point last_updated;
  std::chrono::steady_clock::time_point last_read;
  bool active = false;
  /// True when the device pushes updates; false for poll-only subscriptions.
  bool pushed = false;
};

struct TelemetryMetrics {
  uint64_t reads = 0;
  uint64_t cache_hits = 0;
  uint64_t round_trips = 0;
  uint64_t failures = 0;
  uint64_t stale_serves = 0;
  /// Reads that joined a fetch already in flight for the same key.
  uint64_t coalesced = 0;
  uint64_t updates_applied = 0;
};

/**
 * Live telemetry on top of the connection registry and cache.
 *
 * Reads never throw and never fail hard: a device error yields the last good
 * value (flagged stale) or an explicit unavailable reading. Concurrent misses
 * for the same key share a single device round trip. The manager installs
 * itself as the registry's update callback so pushed values land in the cache.
 */
class TelemetryManager {
 public:
  TelemetryManager(TelemetryConfig config, ConnectionRegistry& registry,
                   CacheManager& cache, const DeviceDirectory& directory);
  ~TelemetryManager();

  TelemetryManager(const TelemetryManager&) = delete;
  TelemetryManager& operator=(const TelemetryManager&) = delete;

  /// Start the background refresh thread.
  bool Start();
  void Stop();

  /**
   * Make sure one active subscription exists for the tuple. Idempotent.
   * Devices that cannot push get a poll-only subscription.
   */
  Status EnsureSubscribed(const std::string& device_id, const std::string& parameter,
                          ValueFormat format = ValueFormat::kVal);
  TelemetryReading Read(const std::string& device_id, const std::string& parameter,
                        ValueFormat format = ValueFormat::kVal);
  /**
   * Read several parameters concurrently. The result has one entry per
   * requested parameter, in order; entries with no value are empty.
   */
  std::vector<std::optional<ParamValue>> ReadBatch(const std::string& device_id,
                                                   const std::vector<std::string>& parameters,
                                                   ValueFormat format = ValueFormat::kVal);
  /// ReadBatch over prefix0 .. prefix(count-1).
  std::vector<std::optional<ParamValue>> ReadIndexed(const std::string& device_id,
                                                     const std::string& prefix, int count,
                                                     ValueFormat format = ValueFormat::kVal);

  std::vector<SubscriptionInfo> GetSubscriptions() const;
  TelemetryMetrics GetMetrics() const;
  std::string GetLastError() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef AVLINK_TESTING
  friend void test::RunTelemetryRefresh(TelemetryManager& manager,
                                        std::chrono::steady_clock::time_point now);
  friend ReadSource test::LoadAfterCacheMiss(TelemetryManager& manager,
                                             const std::string& device_id,
                                             const std::string& parameter);
#endif
};

}  // namespace avlink
