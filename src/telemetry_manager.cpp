#include "avlink/telemetry_manager.h"

#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace avlink {
namespace {

using Clock = std::chrono::steady_clock;

std::string ValueKey(const std::string& device_id, const std::string& parameter,
                     ValueFormat format) {
  return device_id + "|" + parameter + "|" + ValueFormatName(format);
}

struct FetchResult {
  Status status;
  ParamValue value;
  /// Filled by another caller's round trip that finished first.
  bool cached = false;
};

}  // namespace

bool TelemetryConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (cache_ttl.count() <= 0) {
    return fail("cache_ttl must be positive");
  }
  if (stale_bound < cache_ttl) {
    return fail("stale_bound must be >= cache_ttl");
  }
  if (retention.count() <= 0 || refresh_interval.count() <= 0) {
    return fail("retention and refresh_interval must be positive");
  }
  return true;
}

const char* ReadSourceName(ReadSource source) {
  switch (source) {
    case ReadSource::kFresh:
      return "fresh";
    case ReadSource::kCached:
      return "cached";
    case ReadSource::kStale:
      return "stale";
    case ReadSource::kUnavailable:
      return "unavailable";
  }
  return "unavailable";
}

struct TelemetryManager::Impl {
  struct Subscription {
    SubscriptionInfo info;
    std::string endpoint_key;
    // Connect generation the device-side subscription was issued on.
    uint64_t generation = 0;
  };

  struct Counters {
    std::atomic<uint64_t> reads{0};
    std::atomic<uint64_t> cache_hits{0};
    std::atomic<uint64_t> round_trips{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> stale_serves{0};
    std::atomic<uint64_t> coalesced{0};
    std::atomic<uint64_t> updates_applied{0};
  };

  Impl(TelemetryConfig cfg, ConnectionRegistry& reg, CacheManager& c,
       const DeviceDirectory& dir)
      : config(std::move(cfg)),
        registry(reg),
        cache(c),
        directory(dir),
        logger("telemetry", config.log_callback, config.log_level) {}

  void Store(const std::string& key, const ParamValue& value) {
    cache.Set(kTelemetryNamespace, key, value, config.cache_ttl);
    cache.Set(kTelemetryLastGoodNamespace, key, value, config.stale_bound);
  }

  FetchResult Fetch(const std::string& device_id, const std::string& parameter,
                    ValueFormat format) {
    FetchResult result;
    auto endpoint = directory.Lookup(device_id);
    if (!endpoint.has_value()) {
      result.status = Status(ErrorCode::kDeviceNotFound, "unknown device " + device_id);
      return result;
    }
    Response response;
    // A kConnectionError means nothing was written (the session dropped since
    // the last borrow), so one fresh acquire and resend is safe.
    for (int attempt = 0; attempt < 2; ++attempt) {
      ConnectionHandle handle;
      result.status = registry.Acquire(*endpoint, &handle);
      if (!result.status.ok()) {
        break;
      }
      result.status = handle->SendCommand(Command::Get(parameter, format), &response);
      if (result.status.code != ErrorCode::kConnectionError) {
        counters.round_trips++;
        break;
      }
    }
    if (result.status.ok()) {
      if (HasValue(response.value)) {
        result.value = response.value;
      } else {
        result.status = Status(ErrorCode::kProtocolError, "empty value for " + parameter);
      }
    }
    return result;
  }

  // Fetch through the device, sharing one round trip between concurrent
  // callers for the same key. Successful values are cached.
  FetchResult Load(const std::string& device_id, const std::string& parameter,
                   ValueFormat format) {
    const std::string key = ValueKey(device_id, parameter, format);
    std::promise<FetchResult> promise;
    std::shared_future<FetchResult> future;
    bool leader = false;
    {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = inflight.find(key);
      if (it != inflight.end()) {
        future = it->second;
      } else if (auto cached = cache.Get(kTelemetryNamespace, key)) {
        // A leader stored the value after this caller's cache miss.
        FetchResult result;
        result.value = std::move(*cached);
        result.cached = true;
        return result;
      } else {
        future = promise.get_future().share();
        inflight.emplace(key, future);
        leader = true;
      }
    }
    if (!leader) {
      counters.coalesced++;
      return future.get();
    }
    FetchResult result = Fetch(device_id, parameter, format);
    if (result.status.ok()) {
      Store(key, result.value);
      std::lock_guard<std::mutex> lock(mutex);
      auto sub = subscriptions.find(key);
      if (sub != subscriptions.end()) {
        sub->second.info.last_value = result.value;
        sub->second.info.last_updated = Clock::now();
      }
    } else {
      logger.Warn("read_failed", result.status.ToString(),
                  {{"device", device_id}, {"parameter", parameter}});
    }
    promise.set_value(result);
    {
      std::lock_guard<std::mutex> lock(mutex);
      inflight.erase(key);
    }
    return result;
  }

  void Touch(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = subscriptions.find(key);
    if (it != subscriptions.end()) {
      it->second.info.last_read = now;
    }
  }

  TelemetryReading Read(const std::string& device_id, const std::string& parameter,
                        ValueFormat format) {
    counters.reads++;
    const std::string key = ValueKey(device_id, parameter, format);
    Touch(key, Clock::now());

    TelemetryReading reading;
    if (auto cached = cache.Get(kTelemetryNamespace, key)) {
      counters.cache_hits++;
      reading.source = ReadSource::kCached;
      reading.value = std::move(*cached);
      return reading;
    }
    FetchResult result = Load(device_id, parameter, format);
    if (result.cached) {
      counters.cache_hits++;
      reading.source = ReadSource::kCached;
      reading.value = std::move(result.value);
      return reading;
    }
    if (result.status.ok()) {
      reading.source = ReadSource::kFresh;
      reading.value = std::move(result.value);
      return reading;
    }
    counters.failures++;
    reading.error = result.status;
    if (auto last_good = cache.Get(kTelemetryLastGoodNamespace, key)) {
      counters.stale_serves++;
      reading.source = ReadSource::kStale;
      reading.value = std::move(*last_good);
    } else {
      reading.source = ReadSource::kUnavailable;
    }
    return reading;
  }

  void HandleUpdate(const DeviceEndpoint& endpoint, const ParameterUpdate& update) {
    if (!HasValue(update.value)) {
      return;
    }
    const std::string endpoint_key = endpoint.Key();
    std::vector<std::string> keys;
    {
      std::lock_guard<std::mutex> lock(mutex);
      for (auto& entry : subscriptions) {
        Subscription& sub = entry.second;
        if (sub.info.active && sub.endpoint_key == endpoint_key &&
            sub.info.parameter == update.parameter && sub.info.format == update.format) {
          sub.info.last_value = update.value;
          sub.info.last_updated = Clock::now();
          keys.push_back(entry.first);
        }
      }
    }
    for (const auto& key : keys) {
      Store(key, update.value);
      counters.updates_applied++;
    }
  }

  Status Subscribe(const std::string& device_id, const std::string& parameter,
                   ValueFormat format) {
    const std::string key = ValueKey(device_id, parameter, format);
    const auto now = Clock::now();
    {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = subscriptions.find(key);
      if (it != subscriptions.end() && it->second.info.active) {
        it->second.info.last_read = now;
        return Status::Ok();
      }
    }
    auto endpoint = directory.Lookup(device_id);
    if (!endpoint.has_value()) {
      return Status(ErrorCode::kDeviceNotFound, "unknown device " + device_id);
    }
    ConnectionHandle handle;
    Status status = registry.Acquire(*endpoint, &handle);
    if (!status.ok()) {
      return status;
    }
    const bool pushed = handle->SupportsSubscriptions();
    if (pushed) {
      status = handle->SendCommand(Command::Subscribe(parameter, format), nullptr);
      if (!status.ok()) {
        logger.Warn("subscription", "subscribe failed: " + status.ToString(),
                    {{"device", device_id}, {"parameter", parameter}});
        return status;
      }
    }
    const uint64_t generation = handle->connect_generation();
    {
      std::lock_guard<std::mutex> lock(mutex);
      Subscription& sub = subscriptions[key];
      sub.info.device_id = device_id;
      sub.info.parameter = parameter;
      sub.info.format = format;
      sub.info.active = true;
      sub.info.pushed = pushed;
      sub.info.last_read = now;
      sub.endpoint_key = endpoint->Key();
      sub.generation = generation;
    }
    logger.Info("subscription", pushed ? "subscribed" : "polling",
                {{"device", device_id},
                 {"parameter", parameter},
                 {"format", ValueFormatName(format)}});
    return Status::Ok();
  }

  void Unsubscribe(const SubscriptionInfo& info) {
    auto endpoint = directory.Lookup(info.device_id);
    if (!endpoint.has_value()) {
      return;
    }
    ConnectionHandle handle;
    Status status = registry.Acquire(*endpoint, &handle);
    if (status.ok()) {
      status = handle->SendCommand(Command::Unsubscribe(info.parameter, info.format), nullptr);
    }
    if (!status.ok()) {
      logger.Debug("subscription", "unsubscribe failed: " + status.ToString(),
                   {{"device", info.device_id}, {"parameter", info.parameter}});
    }
  }

  void Refresh(Clock::time_point now) {
    std::vector<SubscriptionInfo> retired;
    std::map<std::string, std::vector<std::pair<std::string, Subscription>>> by_device;
    {
      std::lock_guard<std::mutex> lock(mutex);
      for (auto& entry : subscriptions) {
        Subscription& sub = entry.second;
        if (!sub.info.active) {
          continue;
        }
        if (now - sub.info.last_read > config.retention) {
          sub.info.active = false;
          retired.push_back(sub.info);
          continue;
        }
        by_device[sub.info.device_id].emplace_back(entry.first, sub);
      }
    }

    for (const auto& info : retired) {
      logger.Info("subscription", "deactivated after retention window",
                  {{"device", info.device_id}, {"parameter", info.parameter}});
      if (info.pushed) {
        Unsubscribe(info);
      }
    }

    for (const auto& device : by_device) {
      auto endpoint = directory.Lookup(device.first);
      if (!endpoint.has_value()) {
        continue;
      }
      bool any_pushed = false;
      for (const auto& item : device.second) {
        any_pushed = any_pushed || item.second.info.pushed;
      }
      if (any_pushed) {
        ResubscribeAndPoll(*endpoint, device.second);
      }
      for (const auto& item : device.second) {
        if (!cache.Get(kTelemetryNamespace, item.first).has_value()) {
          Load(item.second.info.device_id, item.second.info.parameter,
               item.second.info.format);
        }
      }
    }
  }

  // Re-issue device-side subscriptions lost with a previous session, then
  // dispatch any pushed updates waiting on the current one.
  void ResubscribeAndPoll(const DeviceEndpoint& endpoint,
                          const std::vector<std::pair<std::string, Subscription>>& subs) {
    ConnectionHandle handle;
    Status status = registry.Acquire(endpoint, &handle);
    if (!status.ok()) {
      logger.Debug("refresh", status.ToString(), {{"device", endpoint.id}});
      return;
    }
    const uint64_t generation = handle->connect_generation();
    for (const auto& item : subs) {
      const Subscription& sub = item.second;
      if (!sub.info.pushed || sub.generation == generation) {
        continue;
      }
      status = handle->SendCommand(Command::Subscribe(sub.info.parameter, sub.info.format),
                                   nullptr);
      if (!status.ok()) {
        logger.Warn("subscription", "resubscribe failed: " + status.ToString(),
                    {{"device", endpoint.id}, {"parameter", sub.info.parameter}});
        return;
      }
      {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = subscriptions.find(item.first);
        if (it != subscriptions.end()) {
          it->second.generation = generation;
        }
      }
      logger.Info("subscription", "resubscribed after reconnect",
                  {{"device", endpoint.id}, {"parameter", sub.info.parameter}});
    }
    status = handle->PollUpdates();
    if (!status.ok()) {
      logger.Debug("refresh", "poll failed: " + status.ToString(), {{"device", endpoint.id}});
    }
  }

  void RefreshLoop() {
    std::unique_lock<std::mutex> lock(run_mutex);
    while (running) {
      run_cv.wait_for(lock, config.refresh_interval, [this]() { return !running; });
      if (!running) {
        return;
      }
      lock.unlock();
      Refresh(Clock::now());
      lock.lock();
    }
  }

  TelemetryConfig config;
  ConnectionRegistry& registry;
  CacheManager& cache;
  const DeviceDirectory& directory;
  Logger logger;

  mutable std::mutex mutex;
  std::unordered_map<std::string, Subscription> subscriptions;
  std::unordered_map<std::string, std::shared_future<FetchResult>> inflight;

  std::mutex run_mutex;
  std::condition_variable run_cv;
  bool running = false;
  std::thread refresh_thread;
  std::string last_error;

  Counters counters;
};

TelemetryManager::TelemetryManager(TelemetryConfig config, ConnectionRegistry& registry,
                                   CacheManager& cache, const DeviceDirectory& directory)
    : impl_(new Impl(std::move(config), registry, cache, directory)) {
  Impl* impl = impl_.get();
  registry.SetUpdateCallback(
      [impl](const DeviceEndpoint& endpoint, const ParameterUpdate& update) {
        impl->HandleUpdate(endpoint, update);
      });
}

TelemetryManager::~TelemetryManager() {
  Stop();
  impl_->registry.SetUpdateCallback(nullptr);
}

bool TelemetryManager::Start() {
  std::lock_guard<std::mutex> lock(impl_->run_mutex);
  if (impl_->running) {
    return true;
  }
  std::string error;
  if (!impl_->config.Validate(&error)) {
    impl_->last_error = "invalid telemetry config: " + error;
    impl_->logger.Error("start", impl_->last_error);
    return false;
  }
  impl_->running = true;
  try {
    impl_->refresh_thread = std::thread([this]() { impl_->RefreshLoop(); });
  } catch (const std::exception& ex) {
    impl_->running = false;
    impl_->last_error = std::string("thread start failed: ") + ex.what();
    impl_->logger.Error("start", impl_->last_error);
    return false;
  }
  return true;
}

void TelemetryManager::Stop() {
  {
    std::lock_guard<std::mutex> lock(impl_->run_mutex);
    impl_->running = false;
  }
  impl_->run_cv.notify_all();
  if (impl_->refresh_thread.joinable()) {
    impl_->refresh_thread.join();
  }
}

Status TelemetryManager::EnsureSubscribed(const std::string& device_id,
                                          const std::string& parameter, ValueFormat format) {
  if (device_id.empty() || parameter.empty()) {
    return Status(ErrorCode::kValidationError, "device_id and parameter are required");
  }
  return impl_->Subscribe(device_id, parameter, format);
}

TelemetryReading TelemetryManager::Read(const std::string& device_id,
                                        const std::string& parameter, ValueFormat format) {
  return impl_->Read(device_id, parameter, format);
}

std::vector<std::optional<ParamValue>> TelemetryManager::ReadBatch(
    const std::string& device_id, const std::vector<std::string>& parameters,
    ValueFormat format) {
  std::vector<std::future<TelemetryReading>> pending;
  pending.reserve(parameters.size());
  for (const auto& parameter : parameters) {
    pending.push_back(std::async(std::launch::async, [this, device_id, parameter, format]() {
      return impl_->Read(device_id, parameter, format);
    }));
  }
  std::vector<std::optional<ParamValue>> values;
  values.reserve(parameters.size());
  for (auto& future : pending) {
    TelemetryReading reading = future.get();
    if (reading.has_value()) {
      values.emplace_back(std::move(reading.value));
    } else {
      values.emplace_back(std::nullopt);
    }
  }
  return values;
}

std::vector<std::optional<ParamValue>> TelemetryManager::ReadIndexed(
    const std::string& device_id, const std::string& prefix, int count, ValueFormat format) {
  std::vector<std::string> parameters;
  for (int i = 0; i < count; ++i) {
    parameters.push_back(prefix + std::to_string(i));
  }
  return ReadBatch(device_id, parameters, format);
}

std::vector<SubscriptionInfo> TelemetryManager::GetSubscriptions() const {
  std::vector<SubscriptionInfo> result;
  std::lock_guard<std::mutex> lock(impl_->mutex);
  result.reserve(impl_->subscriptions.size());
  for (const auto& entry : impl_->subscriptions) {
    result.push_back(entry.second.info);
  }
  return result;
}

TelemetryMetrics TelemetryManager::GetMetrics() const {
  TelemetryMetrics snapshot;
  snapshot.reads = impl_->counters.reads.load();
  snapshot.cache_hits = impl_->counters.cache_hits.load();
  snapshot.round_trips = impl_->counters.round_trips.load();
  snapshot.failures = impl_->counters.failures.load();
  snapshot.stale_serves = impl_->counters.stale_serves.load();
  snapshot.coalesced = impl_->counters.coalesced.load();
  snapshot.updates_applied = impl_->counters.updates_applied.load();
  return snapshot;
}

std::string TelemetryManager::GetLastError() const {
  std::lock_guard<std::mutex> lock(impl_->run_mutex);
  return impl_->last_error;
}

#ifdef AVLINK_TESTING
namespace test {

void RunTelemetryRefresh(TelemetryManager& manager,
                         std::chrono::steady_clock::time_point now) {
  manager.impl_->Refresh(now);
}

ReadSource LoadAfterCacheMiss(TelemetryManager& manager, const std::string& device_id,
                              const std::string& parameter) {
  const FetchResult result = manager.impl_->Load(device_id, parameter, ValueFormat::kVal);
  if (result.cached) {
    return ReadSource::kCached;
  }
  return result.status.ok() ? ReadSource::kFresh : ReadSource::kUnavailable;
}

}  // namespace test
#endif

}  // namespace avlink
