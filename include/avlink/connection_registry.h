#pragma once

#include "avlink/logging.h"
#include "avlink/protocol_client.h"
#include "avlink/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace avlink {

class ConnectionRegistry;

#ifdef AVLINK_TESTING
namespace test {
void SweepIdle(ConnectionRegistry& registry, std::chrono::steady_clock::time_point now);
void SetLastActivity(ConnectionRegistry& registry, const std::string& key,
                     std::chrono::steady_clock::time_point when);
int GetBorrowCount(ConnectionRegistry& registry, const std::string& key);
}  // namespace test
#endif

/**
 * Registry configuration.
 */
struct RegistryConfig {
  /// Close connections with no borrowers after this much inactivity.
  std::chrono::milliseconds idle_timeout{300000};
  /// How often the background sweep looks for idle connections.
  std::chrono::milliseconds sweep_interval{30000};
  /// Options handed to every client the registry creates.
  ClientOptions client_options;
  /// Optional structured log sink (defaults to stderr).
  LogCallback log_callback;
  LogLevel log_level = LogLevel::kInfo;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Snapshot of one pooled connection.
 */
struct ConnectionInfo {
  std::string key;
  std::string device_id;
  ProtocolKind kind = ProtocolKind::kAtlas;
  ConnectionState state = ConnectionState::kDisconnected;
  int borrow_count = 0;
  std::chrono::steady_clock::time_point last_activity;
  uint64_t connect_generation = 0;
  bool retired = false;
};

struct RegistryMetrics {
  uint64_t acquires = 0;
  uint64_t releases = 0;
  uint64_t connect_failures = 0;
  uint64_t reclaimed = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Borrowed reference to a pooled client. Move-only; releases on destruction.
 * The registry must outlive every handle it hands out.
 */
class ConnectionHandle {
 public:
  ConnectionHandle() = default;
  ~ConnectionHandle();

  ConnectionHandle(ConnectionHandle&& other) noexcept;
  ConnectionHandle& operator=(ConnectionHandle&& other) noexcept;
  ConnectionHandle(const ConnectionHandle&) = delete;
  ConnectionHandle& operator=(const ConnectionHandle&) = delete;

  explicit operator bool() const { return client_ != nullptr; }
  ProtocolClient* operator->() const { return client_.get(); }
  ProtocolClient& client() const { return *client_; }
  const std::string& key() const { return key_; }

  /// Return the borrow early. Safe to call more than once.
  void Release();

 private:
  friend class ConnectionRegistry;
  ConnectionHandle(ConnectionRegistry* registry, std::string key,
                   std::shared_ptr<ProtocolClient> client);

  ConnectionRegistry* registry_ = nullptr;
  std::string key_;
  std::shared_ptr<ProtocolClient> client_;
};

/**
 * Keyed pool of protocol clients, one per (address, port).
 *
 * Borrowers are reference counted. A connection is only ever closed with a
 * zero borrow count: Acquire increments the count under the registry lock
 * before connecting, and the idle sweep only acts on zero-count entries under
 * the same lock. Connects run under a per-entry mutex so unrelated devices
 * never wait on each other.
 */
class ConnectionRegistry {
 public:
  using ClientFactory = std::function<std::unique_ptr<ProtocolClient>(
      const DeviceEndpoint&, const ClientOptions&)>;

  /// A null factory creates TcpProtocolClient instances.
  explicit ConnectionRegistry(RegistryConfig config, ClientFactory factory = nullptr);
  /// Stops the sweep thread and closes every connection.
  ~ConnectionRegistry();

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  /// Start the idle sweep thread.
  bool Start();
  /// Stop the sweep thread and close every connection.
  void Stop();

  /**
   * Borrow the client for an endpoint, connecting it if needed.
   * Concurrent first acquirers share one connect attempt.
   *
   * @return kConnectionError if the connect fails (no borrow is held).
   */
  Status Acquire(const DeviceEndpoint& endpoint, ConnectionHandle* out);
  /// Return a borrow. Never drops the count below zero; never closes.
  void Release(ConnectionHandle& handle);
  /// Remove the entry at the next sweep that finds it without borrowers.
  void Retire(const DeviceEndpoint& endpoint);

  std::vector<ConnectionInfo> GetConnections() const;
  /// Forward pushed updates from every pooled client.
  void SetUpdateCallback(ProtocolClient::UpdateCallback cb);
  RegistryMetrics GetMetrics() const;
  std::string GetLastError() const;

 private:
  struct Impl;
  void ReleaseKey(const std::string& key, const ProtocolClient* client);

  std::unique_ptr<Impl> impl_;

#ifdef AVLINK_TESTING
  friend void test::SweepIdle(ConnectionRegistry& registry,
                              std::chrono::steady_clock::time_point now);
  friend void test::SetLastActivity(ConnectionRegistry& registry, const std::string& key,
                                    std::chrono::steady_clock::time_point when);
  friend int test::GetBorrowCount(ConnectionRegistry& registry, const std::string& key);
#endif
};

}  // namespace avlink
