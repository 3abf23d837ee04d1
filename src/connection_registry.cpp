#include "avlink/connection_registry.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace avlink {
namespace {

using Clock = std::chrono::steady_clock;

bool NeedsConnect(ConnectionState state) {
  return state == ConnectionState::kDisconnected || state == ConnectionState::kErrored;
}

}  // namespace

bool RegistryConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (idle_timeout.count() <= 0) {
    return fail("idle_timeout must be positive");
  }
  if (sweep_interval.count() <= 0) {
    return fail("sweep_interval must be positive");
  }
  std::string client_error;
  if (!client_options.Validate(&client_error)) {
    return fail("client_options." + client_error);
  }
  return true;
}

ConnectionHandle::ConnectionHandle(ConnectionRegistry* registry, std::string key,
                                   std::shared_ptr<ProtocolClient> client)
    : registry_(registry), key_(std::move(key)), client_(std::move(client)) {}

ConnectionHandle::~ConnectionHandle() { Release(); }

ConnectionHandle::ConnectionHandle(ConnectionHandle&& other) noexcept
    : registry_(other.registry_),
      key_(std::move(other.key_)),
      client_(std::move(other.client_)) {
  other.registry_ = nullptr;
  other.client_.reset();
}

ConnectionHandle& ConnectionHandle::operator=(ConnectionHandle&& other) noexcept {
  if (this != &other) {
    Release();
    registry_ = other.registry_;
    key_ = std::move(other.key_);
    client_ = std::move(other.client_);
    other.registry_ = nullptr;
    other.client_.reset();
  }
  return *this;
}

void ConnectionHandle::Release() {
  if (registry_ && client_) {
    registry_->Release(*this);
  }
  registry_ = nullptr;
  client_.reset();
}

struct ConnectionRegistry::Impl {
  struct Entry {
    DeviceEndpoint endpoint;
    std::shared_ptr<ProtocolClient> client;
    int borrow_count = 0;
    Clock::time_point last_activity;
    bool retired = false;
    // Serializes connect attempts for this entry only.
    std::mutex connect_mutex;
  };

  struct Counters {
    std::atomic<uint64_t> acquires{0};
    std::atomic<uint64_t> releases{0};
    std::atomic<uint64_t> connect_failures{0};
    std::atomic<uint64_t> reclaimed{0};
    std::atomic<uint64_t> callback_exceptions{0};
  };

  Impl(RegistryConfig cfg, ClientFactory client_factory)
      : config(std::move(cfg)),
        factory(std::move(client_factory)),
        logger("registry", config.log_callback, config.log_level) {
    if (!factory) {
      factory = [](const DeviceEndpoint& endpoint, const ClientOptions& options) {
        return std::unique_ptr<ProtocolClient>(new TcpProtocolClient(endpoint, options));
      };
    }
  }

  void ForwardUpdate(const DeviceEndpoint& endpoint, const ParameterUpdate& update) {
    ProtocolClient::UpdateCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex);
      callback = update_callback;
    }
    if (!callback) {
      return;
    }
    try {
      callback(endpoint, update);
    } catch (const std::exception& ex) {
      counters.callback_exceptions++;
      logger.Error("callback", std::string("update callback threw: ") + ex.what(),
                   {{"device", endpoint.id}});
    }
  }

  void Sweep(Clock::time_point now) {
    std::vector<std::shared_ptr<Entry>> reclaimed;
    {
      std::lock_guard<std::mutex> lock(mutex);
      for (auto it = entries.begin(); it != entries.end();) {
        Entry& entry = *it->second;
        if (entry.borrow_count == 0 &&
            (entry.retired || now - entry.last_activity > config.idle_timeout)) {
          reclaimed.push_back(it->second);
          it = entries.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (const auto& entry : reclaimed) {
      entry->client->Disconnect();
      counters.reclaimed++;
      logger.Info("idle_reclaim",
                  entry->retired ? "removed retired connection" : "closed idle connection",
                  {{"device", entry->endpoint.id}, {"endpoint", entry->endpoint.Key()}});
    }
  }

  void SweepLoop() {
    std::unique_lock<std::mutex> lock(run_mutex);
    while (running) {
      run_cv.wait_for(lock, config.sweep_interval, [this]() { return !running; });
      if (!running) {
        return;
      }
      lock.unlock();
      Sweep(Clock::now());
      lock.lock();
    }
  }

  void CloseAll() {
    std::vector<std::shared_ptr<Entry>> closing;
    {
      std::lock_guard<std::mutex> lock(mutex);
      for (auto it = entries.begin(); it != entries.end();) {
        closing.push_back(it->second);
        if (it->second->borrow_count == 0) {
          it = entries.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (const auto& entry : closing) {
      if (entry->client->state() != ConnectionState::kDisconnected) {
        entry->client->Disconnect();
      }
    }
  }

  RegistryConfig config;
  ClientFactory factory;
  Logger logger;

  mutable std::mutex mutex;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries;

  std::mutex callback_mutex;
  ProtocolClient::UpdateCallback update_callback;

  std::mutex run_mutex;
  std::condition_variable run_cv;
  bool running = false;
  std::thread sweep_thread;
  std::string last_error;

  Counters counters;
};

ConnectionRegistry::ConnectionRegistry(RegistryConfig config, ClientFactory factory)
    : impl_(new Impl(std::move(config), std::move(factory))) {}

ConnectionRegistry::~ConnectionRegistry() { Stop(); }

bool ConnectionRegistry::Start() {
  std::lock_guard<std::mutex> lock(impl_->run_mutex);
  if (impl_->running) {
    return true;
  }
  std::string error;
  if (!impl_->config.Validate(&error)) {
    impl_->last_error = "invalid registry config: " + error;
    impl_->logger.Error("start", impl_->last_error);
    return false;
  }
  impl_->running = true;
  try {
    impl_->sweep_thread = std::thread([this]() { impl_->SweepLoop(); });
  } catch (const std::exception& ex) {
    impl_->running = false;
    impl_->last_error = std::string("thread start failed: ") + ex.what();
    impl_->logger.Error("start", impl_->last_error);
    return false;
  }
  return true;
}

void ConnectionRegistry::Stop() {
  {
    std::lock_guard<std::mutex> lock(impl_->run_mutex);
    impl_->running = false;
  }
  impl_->run_cv.notify_all();
  if (impl_->sweep_thread.joinable()) {
    impl_->sweep_thread.join();
  }
  impl_->CloseAll();
}

Status ConnectionRegistry::Acquire(const DeviceEndpoint& endpoint, ConnectionHandle* out) {
  const std::string key = endpoint.Key();
  std::shared_ptr<Impl::Entry> entry;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto& slot = impl_->entries[key];
    if (!slot) {
      std::unique_ptr<ProtocolClient> client =
          impl_->factory(endpoint, impl_->config.client_options);
      if (!client) {
        impl_->entries.erase(key);
        return Status(ErrorCode::kConnectionError, "no client for " + key);
      }
      Impl* impl = impl_.get();
      client->SetUpdateCallback(
          [impl](const DeviceEndpoint& source, const ParameterUpdate& update) {
            impl->ForwardUpdate(source, update);
          });
      slot = std::make_shared<Impl::Entry>();
      slot->endpoint = endpoint;
      slot->client = std::move(client);
    }
    entry = slot;
    entry->borrow_count++;
    entry->last_activity = Clock::now();
  }
  impl_->counters.acquires++;

  Status status;
  {
    std::lock_guard<std::mutex> connect_lock(entry->connect_mutex);
    if (NeedsConnect(entry->client->state())) {
      status = entry->client->Connect();
    }
  }
  if (!status.ok()) {
    {
      std::lock_guard<std::mutex> lock(impl_->mutex);
      if (entry->borrow_count > 0) {
        entry->borrow_count--;
      }
    }
    impl_->counters.connect_failures++;
    impl_->logger.Warn("connect_failed", status.message,
                       {{"device", endpoint.id}, {"endpoint", key}});
    return status;
  }
  if (out) {
    *out = ConnectionHandle(this, key, entry->client);
  } else {
    ReleaseKey(key, entry->client.get());
  }
  return Status::Ok();
}

void ConnectionRegistry::Release(ConnectionHandle& handle) {
  if (!handle.client_) {
    return;
  }
  ReleaseKey(handle.key_, handle.client_.get());
  handle.registry_ = nullptr;
  handle.client_.reset();
}

void ConnectionRegistry::ReleaseKey(const std::string& key, const ProtocolClient* client) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->entries.find(key);
  if (it == impl_->entries.end() || it->second->client.get() != client) {
    return;
  }
  if (it->second->borrow_count > 0) {
    it->second->borrow_count--;
    impl_->counters.releases++;
  }
  it->second->last_activity = Clock::now();
}

void ConnectionRegistry::Retire(const DeviceEndpoint& endpoint) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->entries.find(endpoint.Key());
  if (it != impl_->entries.end()) {
    it->second->retired = true;
  }
}

std::vector<ConnectionInfo> ConnectionRegistry::GetConnections() const {
  std::vector<std::shared_ptr<Impl::Entry>> entries;
  std::vector<ConnectionInfo> result;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& item : impl_->entries) {
      ConnectionInfo info;
      info.key = item.first;
      info.device_id = item.second->endpoint.id;
      info.kind = item.second->endpoint.kind;
      info.borrow_count = item.second->borrow_count;
      info.last_activity = item.second->last_activity;
      info.retired = item.second->retired;
      result.push_back(info);
      entries.push_back(item.second);
    }
  }
  // Client state has its own lock; read it outside the registry lock.
  for (size_t i = 0; i < result.size(); ++i) {
    result[i].state = entries[i]->client->state();
    result[i].connect_generation = entries[i]->client->connect_generation();
  }
  return result;
}

void ConnectionRegistry::SetUpdateCallback(ProtocolClient::UpdateCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->update_callback = std::move(cb);
}

RegistryMetrics ConnectionRegistry::GetMetrics() const {
  RegistryMetrics snapshot;
  snapshot.acquires = impl_->counters.acquires.load();
  snapshot.releases = impl_->counters.releases.load();
  snapshot.connect_failures = impl_->counters.connect_failures.load();
  snapshot.reclaimed = impl_->counters.reclaimed.load();
  snapshot.callback_exceptions = impl_->counters.callback_exceptions.load();
  return snapshot;
}

std::string ConnectionRegistry::GetLastError() const {
  std::lock_guard<std::mutex> lock(impl_->run_mutex);
  return impl_->last_error;
}

#ifdef AVLINK_TESTING
namespace test {

void SweepIdle(ConnectionRegistry& registry, std::chrono::steady_clock::time_point now) {
  registry.impl_->Sweep(now);
}

void SetLastActivity(ConnectionRegistry& registry, const std::string& key,
                     std::chrono::steady_clock::time_point when) {
  std::lock_guard<std::mutex> lock(registry.impl_->mutex);
  auto it = registry.impl_->entries.find(key);
  if (it != registry.impl_->entries.end()) {
    it->second->last_activity = when;
  }
}

int GetBorrowCount(ConnectionRegistry& registry, const std::string& key) {
  std::lock_guard<std::mutex> lock(registry.impl_->mutex);
  auto it = registry.impl_->entries.find(key);
  if (it == registry.impl_->entries.end()) {
    return -1;
  }
  return it->second->borrow_count;
}

}  // namespace test
#endif

}  // namespace avlink
