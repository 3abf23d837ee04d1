#pragma once

#include "avlink/logging.h"
#include "avlink/types.h"
#include "avlink/wire_codec.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace avlink {

/**
 * Options shared by every protocol client.
 */
struct ClientOptions {
  /// Budget for establishing the TCP session.
  std::chrono::milliseconds connect_timeout{5000};
  /// Per-command timeout override. Zero keeps the protocol default
  /// (Atlas 2 s, Global Cache 1 s, CEC bridge 5 s).
  std::chrono::milliseconds command_timeout{0};
  /// Optional structured log sink (defaults to stderr).
  LogCallback log_callback;
  LogLevel log_level = LogLevel::kInfo;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Counters for one client. Snapshot of atomics.
 */
struct ClientMetrics {
  uint64_t commands_sent = 0;
  uint64_t responses = 0;
  uint64_t timeouts = 0;
  uint64_t protocol_errors = 0;
  uint64_t connection_errors = 0;
  uint64_t updates_received = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * One stateful session to one device.
 *
 * Callers on the same client are served strictly in submission order: every
 * public operation takes a ticket and waits until it is served, so at most
 * one exchange is ever in flight. A timeout or reset closes the session, so a
 * late reply can never be read as the answer to the next request. So does a
 * receive buffer that grows past 64 KiB without a frame terminator. There is no
 * internal retry.
 *
 * Subclasses implement the transport through the Do* hooks, which are only
 * ever called by the thread holding the current ticket.
 */
class ProtocolClient {
 public:
  using UpdateCallback =
      std::function<void(const DeviceEndpoint&, const ParameterUpdate&)>;

  ProtocolClient(DeviceEndpoint endpoint, ClientOptions options);
  virtual ~ProtocolClient();

  ProtocolClient(const ProtocolClient&) = delete;
  ProtocolClient& operator=(const ProtocolClient&) = delete;

  /// Establish the session. No-op when already connected.
  Status Connect();
  /**
   * Send one command and wait for its response.
   *
   * @return kConnectionError if nothing was written (no session, or the peer
   *         closed it while idle), kTimeout, kConnectionReset, kProtocolError,
   *         kValidationError, or Ok.
   */
  Status SendCommand(const Command& command, Response* response);
  /// Issue the protocol's liveness command.
  Status Ping();
  /// Read and dispatch pushed updates already waiting on the session.
  Status PollUpdates();
  /// Close the session. Idempotent.
  void Disconnect();

  ConnectionState state() const;
  const DeviceEndpoint& endpoint() const { return endpoint_; }
  /// Changes on every successful connect. Unique across clients.
  uint64_t connect_generation() const;
  /// Whether the protocol pushes updates for subscriptions.
  virtual bool SupportsSubscriptions() const = 0;

  /// Set callback invoked for pushed parameter updates.
  void SetUpdateCallback(UpdateCallback cb);
  ClientMetrics GetMetrics() const;

 protected:
  virtual Status DoConnect(std::chrono::milliseconds timeout) = 0;
  virtual Status DoExchange(const Command& command, std::chrono::milliseconds timeout,
                            Response* response) = 0;
  virtual Status DoPoll() { return Status::Ok(); }
  virtual void DoDisconnect() = 0;
  virtual Command PingCommand() const = 0;
  virtual std::chrono::milliseconds DefaultCommandTimeout() const = 0;

  /// Deliver a pushed update to the registered callback.
  void NotifyUpdate(const ParameterUpdate& update);
  /// Count a decode failure seen by the transport.
  void CountProtocolError();
  /// Close the session once the current operation returns, whatever its status.
  void MarkSessionBroken() { session_broken_ = true; }

  const ClientOptions& options() const { return options_; }
  const Logger& logger() const { return logger_; }

 private:
  struct Counters;

  uint64_t AwaitTurn(std::unique_lock<std::mutex>& lock);
  void EndTurn(std::unique_lock<std::mutex>& lock);
  void CloseAfterFailure(const Status& status);

  const DeviceEndpoint endpoint_;
  const ClientOptions options_;
  Logger logger_;

  mutable std::mutex mutex_;
  std::condition_variable turn_cv_;
  uint64_t next_ticket_ = 0;
  uint64_t serving_ticket_ = 0;
  ConnectionState state_ = ConnectionState::kDisconnected;
  uint64_t connect_generation_ = 0;
  // Written and read only by the ticket holder.
  bool session_broken_ = false;

  std::mutex callback_mutex_;
  UpdateCallback update_callback_;

  std::unique_ptr<Counters> counters_;
};

/**
 * Protocol client speaking a line-oriented protocol over TCP.
 */
class TcpProtocolClient : public ProtocolClient {
 public:
  /// Uses MakeCodec(endpoint) when no codec is supplied.
  TcpProtocolClient(DeviceEndpoint endpoint, ClientOptions options,
                    std::unique_ptr<WireCodec> codec = nullptr);
  ~TcpProtocolClient() override;

  bool SupportsSubscriptions() const override;

 protected:
  Status DoConnect(std::chrono::milliseconds timeout) override;
  Status DoExchange(const Command& command, std::chrono::milliseconds timeout,
                    Response* response) override;
  Status DoPoll() override;
  void DoDisconnect() override;
  Command PingCommand() const override;
  std::chrono::milliseconds DefaultCommandTimeout() const override;

 private:
  struct Socket;

  // Append whatever the socket already holds to the buffer without blocking.
  Status ReadAvailable();
  // Handle every complete frame in the buffer. Returns true once the
  // awaited response (or a device error for it) was seen.
  bool DrainFrames(bool awaiting, Response* response, Status* status);
  // Unterminated input grew past the limit; the session is dropped.
  Status Overflow();

  std::unique_ptr<WireCodec> codec_;
  std::unique_ptr<Socket> socket_;
  std::string buffer_;
};

}  // namespace avlink
