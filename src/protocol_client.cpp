#include "avlink/protocol_client.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace avlink {
namespace {

using Clock = std::chrono::steady_clock;

timeval ToTimeval(std::chrono::milliseconds duration) {
  if (duration.count() < 0) {
    duration = std::chrono::milliseconds(0);
  }
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
  return tv;
}

std::chrono::milliseconds Remaining(Clock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
}

// Generations are unique across clients, so a replaced client never
// repeats a value observed on its predecessor.
uint64_t NextConnectGeneration() {
  static std::atomic<uint64_t> counter{0};
  return ++counter;
}

// A connection error from an open session means it dropped before the write.
bool IsSessionFatal(ErrorCode code) {
  return code == ErrorCode::kTimeout || code == ErrorCode::kConnectionReset ||
         code == ErrorCode::kConnectionError;
}

// Unterminated input allowed to sit in the receive buffer.
constexpr size_t kMaxPendingBytes = 64 * 1024;

}  // namespace

bool ClientOptions::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (connect_timeout.count() <= 0) {
    return fail("connect_timeout must be positive");
  }
  if (command_timeout.count() < 0) {
    return fail("command_timeout must not be negative");
  }
  return true;
}

struct ProtocolClient::Counters {
  std::atomic<uint64_t> commands_sent{0};
  std::atomic<uint64_t> responses{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> protocol_errors{0};
  std::atomic<uint64_t> connection_errors{0};
  std::atomic<uint64_t> updates_received{0};
  std::atomic<uint64_t> callback_exceptions{0};

  ClientMetrics Snapshot() const {
    ClientMetrics snapshot;
    snapshot.commands_sent = commands_sent.load();
    snapshot.responses = responses.load();
    snapshot.timeouts = timeouts.load();
    snapshot.protocol_errors = protocol_errors.load();
    snapshot.connection_errors = connection_errors.load();
    snapshot.updates_received = updates_received.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

ProtocolClient::ProtocolClient(DeviceEndpoint endpoint, ClientOptions options)
    : endpoint_(std::move(endpoint)),
      options_(std::move(options)),
      logger_("client", options_.log_callback, options_.log_level),
      counters_(new Counters()) {}

ProtocolClient::~ProtocolClient() = default;

uint64_t ProtocolClient::AwaitTurn(std::unique_lock<std::mutex>& lock) {
  const uint64_t ticket = next_ticket_++;
  turn_cv_.wait(lock, [&]() { return serving_ticket_ == ticket; });
  return ticket;
}

void ProtocolClient::EndTurn(std::unique_lock<std::mutex>& lock) {
  ++serving_ticket_;
  lock.unlock();
  turn_cv_.notify_all();
}

Status ProtocolClient::Connect() {
  std::unique_lock<std::mutex> lock(mutex_);
  AwaitTurn(lock);
  if (state_ == ConnectionState::kConnected) {
    EndTurn(lock);
    return Status::Ok();
  }
  state_ = ConnectionState::kConnecting;
  lock.unlock();

  Status status;
  try {
    status = DoConnect(options_.connect_timeout);
  } catch (const std::exception& ex) {
    status = Status(ErrorCode::kConnectionError, std::string("connect threw: ") + ex.what());
  }
  if (!status.ok()) {
    lock.lock();
    state_ = ConnectionState::kErrored;
    lock.unlock();
    DoDisconnect();
  }

  lock.lock();
  uint64_t generation = connect_generation_;
  if (status.ok()) {
    state_ = ConnectionState::kConnected;
    connect_generation_ = NextConnectGeneration();
    generation = connect_generation_;
  } else {
    state_ = ConnectionState::kDisconnected;
  }
  EndTurn(lock);

  if (status.ok()) {
    logger_.Info("connect", "connected to " + endpoint_.Key(),
                 {{"device", endpoint_.id},
                  {"protocol", ProtocolKindName(endpoint_.kind)},
                  {"generation", std::to_string(generation)}});
  } else {
    counters_->connection_errors++;
    if (status.code != ErrorCode::kConnectionError) {
      status = Status(ErrorCode::kConnectionError, status.message);
    }
    logger_.Warn("connect_failed", status.message,
                 {{"device", endpoint_.id}, {"endpoint", endpoint_.Key()}});
  }
  return status;
}

void ProtocolClient::CloseAfterFailure(const Status& status) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ConnectionState::kErrored;
  }
  DoDisconnect();
  if (status.code == ErrorCode::kTimeout) {
    logger_.Warn("timeout", status.message,
                 {{"device", endpoint_.id}, {"endpoint", endpoint_.Key()}});
  } else {
    logger_.Warn("disconnect", status.message,
                 {{"device", endpoint_.id}, {"endpoint", endpoint_.Key()}});
  }
}

Status ProtocolClient::SendCommand(const Command& command, Response* response) {
  Response scratch;
  if (!response) {
    response = &scratch;
  }
  std::unique_lock<std::mutex> lock(mutex_);
  AwaitTurn(lock);
  if (state_ != ConnectionState::kConnected) {
    EndTurn(lock);
    counters_->connection_errors++;
    return Status(ErrorCode::kConnectionError, "not connected to " + endpoint_.Key());
  }
  state_ = ConnectionState::kBusy;
  lock.unlock();

  std::chrono::milliseconds timeout = command.timeout;
  if (timeout.count() <= 0) {
    timeout = options_.command_timeout.count() > 0 ? options_.command_timeout
                                                   : DefaultCommandTimeout();
  }

  counters_->commands_sent++;
  Status status;
  try {
    status = DoExchange(command, timeout, response);
  } catch (const std::exception& ex) {
    status = Status(ErrorCode::kConnectionReset, std::string("exchange threw: ") + ex.what());
  }
  const bool fatal = IsSessionFatal(status.code) || session_broken_;
  session_broken_ = false;
  if (fatal) {
    CloseAfterFailure(status);
  }

  lock.lock();
  state_ = fatal ? ConnectionState::kDisconnected : ConnectionState::kConnected;
  EndTurn(lock);

  switch (status.code) {
    case ErrorCode::kOk:
      if (response->acknowledged) {
        counters_->responses++;
      }
      break;
    case ErrorCode::kTimeout:
      counters_->timeouts++;
      break;
    case ErrorCode::kProtocolError:
      counters_->protocol_errors++;
      break;
    case ErrorCode::kConnectionError:
    case ErrorCode::kConnectionReset:
      counters_->connection_errors++;
      break;
    case ErrorCode::kDeviceNotFound:
    case ErrorCode::kValidationError:
      break;
  }
  logger_.Debug("command", status.ToString(),
                {{"device", endpoint_.id},
                 {"kind", CommandKindName(command.kind)},
                 {"parameter", command.parameter}});
  return status;
}

Status ProtocolClient::Ping() {
  Response response;
  return SendCommand(PingCommand(), &response);
}

Status ProtocolClient::PollUpdates() {
  std::unique_lock<std::mutex> lock(mutex_);
  AwaitTurn(lock);
  if (state_ != ConnectionState::kConnected) {
    EndTurn(lock);
    return Status(ErrorCode::kConnectionError, "not connected to " + endpoint_.Key());
  }
  state_ = ConnectionState::kBusy;
  lock.unlock();

  Status status;
  try {
    status = DoPoll();
  } catch (const std::exception& ex) {
    status = Status(ErrorCode::kConnectionReset, std::string("poll threw: ") + ex.what());
  }
  const bool fatal = IsSessionFatal(status.code) || session_broken_;
  session_broken_ = false;
  if (fatal) {
    if (status.code == ErrorCode::kProtocolError) {
      counters_->protocol_errors++;
    } else {
      counters_->connection_errors++;
    }
    CloseAfterFailure(status);
  }

  lock.lock();
  state_ = fatal ? ConnectionState::kDisconnected : ConnectionState::kConnected;
  EndTurn(lock);
  return status;
}

void ProtocolClient::Disconnect() {
  std::unique_lock<std::mutex> lock(mutex_);
  AwaitTurn(lock);
  const bool was_open = state_ != ConnectionState::kDisconnected;
  lock.unlock();
  if (was_open) {
    DoDisconnect();
  }
  lock.lock();
  state_ = ConnectionState::kDisconnected;
  EndTurn(lock);
  if (was_open) {
    logger_.Info("disconnect", "closed " + endpoint_.Key(), {{"device", endpoint_.id}});
  }
}

ConnectionState ProtocolClient::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

uint64_t ProtocolClient::connect_generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connect_generation_;
}

void ProtocolClient::SetUpdateCallback(UpdateCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  update_callback_ = std::move(cb);
}

ClientMetrics ProtocolClient::GetMetrics() const { return counters_->Snapshot(); }

void ProtocolClient::NotifyUpdate(const ParameterUpdate& update) {
  counters_->updates_received++;
  UpdateCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = update_callback_;
  }
  if (!callback) {
    return;
  }
  try {
    callback(endpoint_, update);
  } catch (const std::exception& ex) {
    counters_->callback_exceptions++;
    logger_.Error("callback", std::string("update callback threw: ") + ex.what(),
                  {{"device", endpoint_.id}});
  }
}

void ProtocolClient::CountProtocolError() { counters_->protocol_errors++; }

// Non-blocking TCP socket with select-based waits.
struct TcpProtocolClient::Socket {
  ~Socket() { Close(); }

  Status Open(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    Close();
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
      return Status(ErrorCode::kConnectionError,
                    "cannot resolve " + host + ": " + ::gai_strerror(rc));
    }
    sockaddr_in addr{};
    std::memcpy(&addr, resolved->ai_addr, sizeof(addr));
    ::freeaddrinfo(resolved);

    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return Status(ErrorCode::kConnectionError,
                    "socket() failed: " + std::string(std::strerror(errno)));
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      Status status(ErrorCode::kConnectionError,
                    "fcntl(O_NONBLOCK) failed: " + std::string(std::strerror(errno)));
      Close();
      return status;
    }
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    std::ostringstream where;
    where << host << ":" << port;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      if (errno != EINPROGRESS) {
        Status status(ErrorCode::kConnectionError,
                      "connect(" + where.str() + ") failed: " + std::strerror(errno));
        Close();
        return status;
      }
      const int ready = WaitWritable(timeout);
      if (ready <= 0) {
        Status status(ErrorCode::kConnectionError,
                      ready == 0 ? "connect(" + where.str() + ") timed out"
                                 : "connect(" + where.str() + ") failed: " +
                                       std::strerror(errno));
        Close();
        return status;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
        Status status(ErrorCode::kConnectionError,
                      "connect(" + where.str() + ") failed: " +
                          std::strerror(so_error != 0 ? so_error : errno));
        Close();
        return status;
      }
    }
    return Status::Ok();
  }

  void Close() {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  // >0 ready, 0 timeout, <0 error.
  int WaitReadable(std::chrono::milliseconds timeout) {
    return Wait(timeout, true);
  }

  int WaitWritable(std::chrono::milliseconds timeout) {
    return Wait(timeout, false);
  }

  Status SendAll(const std::string& data, Clock::time_point deadline) {
    size_t offset = 0;
    while (offset < data.size()) {
      const ssize_t sent =
          ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
      if (sent > 0) {
        offset += static_cast<size_t>(sent);
        continue;
      }
      if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        const int ready = WaitWritable(Remaining(deadline));
        if (ready == 0) {
          return Status(ErrorCode::kTimeout, "send timed out");
        }
        if (ready < 0) {
          return Status(ErrorCode::kConnectionReset,
                        "select() failed: " + std::string(std::strerror(errno)));
        }
        continue;
      }
      return Status(ErrorCode::kConnectionReset,
                    "send() failed: " + std::string(std::strerror(errno)));
    }
    return Status::Ok();
  }

  int fd = -1;

 private:
  int Wait(std::chrono::milliseconds timeout, bool read) {
    if (fd < 0) {
      return -1;
    }
    while (true) {
      fd_set fds;
      FD_ZERO(&fds);
      FD_SET(fd, &fds);
      timeval tv = ToTimeval(timeout);
      const int ready = read ? ::select(fd + 1, &fds, nullptr, nullptr, &tv)
                             : ::select(fd + 1, nullptr, &fds, nullptr, &tv);
      if (ready < 0 && errno == EINTR) {
        continue;
      }
      return ready;
    }
  }
};

TcpProtocolClient::TcpProtocolClient(DeviceEndpoint endpoint, ClientOptions options,
                                     std::unique_ptr<WireCodec> codec)
    : ProtocolClient(endpoint, std::move(options)),
      codec_(codec ? std::move(codec) : MakeCodec(endpoint)),
      socket_(new Socket()) {}

TcpProtocolClient::~TcpProtocolClient() { socket_->Close(); }

bool TcpProtocolClient::SupportsSubscriptions() const {
  return codec_->SupportsSubscriptions();
}

Status TcpProtocolClient::DoConnect(std::chrono::milliseconds timeout) {
  buffer_.clear();
  return socket_->Open(endpoint().address, endpoint().port, timeout);
}

void TcpProtocolClient::DoDisconnect() {
  socket_->Close();
  buffer_.clear();
}

Command TcpProtocolClient::PingCommand() const { return codec_->PingCommand(); }

std::chrono::milliseconds TcpProtocolClient::DefaultCommandTimeout() const {
  return codec_->DefaultTimeout();
}

Status TcpProtocolClient::ReadAvailable() {
  char chunk[4096];
  while (true) {
    const int ready = socket_->WaitReadable(std::chrono::milliseconds(0));
    if (ready == 0) {
      return Status::Ok();
    }
    if (ready < 0) {
      return Status(ErrorCode::kConnectionReset,
                    "select() failed: " + std::string(std::strerror(errno)));
    }
    const ssize_t bytes = ::recv(socket_->fd, chunk, sizeof(chunk), 0);
    if (bytes == 0) {
      return Status(ErrorCode::kConnectionReset, "connection closed by peer");
    }
    if (bytes < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return Status::Ok();
      }
      return Status(ErrorCode::kConnectionReset,
                    "recv() failed: " + std::string(std::strerror(errno)));
    }
    buffer_.append(chunk, static_cast<size_t>(bytes));
    Status unused;
    DrainFrames(false, nullptr, &unused);
    if (buffer_.size() > kMaxPendingBytes) {
      return Overflow();
    }
  }
}

Status TcpProtocolClient::Overflow() {
  const size_t pending = buffer_.size();
  MarkSessionBroken();
  logger().Warn("overflow", "dropping unterminated input",
                {{"device", endpoint().id}, {"bytes", std::to_string(pending)}});
  return Status(ErrorCode::kProtocolError,
                "no frame terminator within " + std::to_string(kMaxPendingBytes) + " bytes");
}

bool TcpProtocolClient::DrainFrames(bool awaiting, Response* response, Status* status) {
  while (auto frame = codec_->ExtractFrame(&buffer_)) {
    Response decoded;
    ParameterUpdate update;
    std::string error;
    switch (codec_->Decode(*frame, &decoded, &update, &error)) {
      case DecodeResult::kUpdate:
        NotifyUpdate(update);
        break;
      case DecodeResult::kIgnored:
        break;
      case DecodeResult::kResponse:
        if (awaiting) {
          *response = std::move(decoded);
          *status = Status::Ok();
          return true;
        }
        logger().Debug("unsolicited", "dropping reply with no pending command",
                       {{"device", endpoint().id}, {"frame", *frame}});
        break;
      case DecodeResult::kDeviceError:
        if (awaiting) {
          *status = Status(ErrorCode::kProtocolError, "device rejected command: " + error);
          return true;
        }
        break;
      case DecodeResult::kMalformed:
        if (awaiting) {
          *status = Status(ErrorCode::kProtocolError, error);
          return true;
        }
        CountProtocolError();
        break;
    }
  }
  return false;
}

Status TcpProtocolClient::DoPoll() { return ReadAvailable(); }

Status TcpProtocolClient::DoExchange(const Command& command,
                                     std::chrono::milliseconds timeout,
                                     Response* response) {
  std::string frame;
  std::string error;
  if (!codec_->Encode(command, &frame, &error)) {
    return Status(ErrorCode::kValidationError, error);
  }
  // Dispatch pushes that arrived while idle so they are not mistaken for
  // the reply.
  Status status = ReadAvailable();
  if (status.code == ErrorCode::kConnectionReset) {
    // Nothing was written, so the caller may resend on a fresh session.
    return Status(ErrorCode::kConnectionError, "session closed before write: " + status.message);
  }
  if (!status.ok()) {
    return status;
  }

  const auto deadline = Clock::now() + timeout;
  status = socket_->SendAll(frame, deadline);
  if (!status.ok()) {
    return status;
  }
  if (!codec_->ExpectsResponse(command)) {
    response->acknowledged = false;
    return Status::Ok();
  }

  char chunk[4096];
  while (true) {
    if (DrainFrames(true, response, &status)) {
      return status;
    }
    if (buffer_.size() > kMaxPendingBytes) {
      return Overflow();
    }
    const auto remaining = Remaining(deadline);
    if (remaining.count() <= 0) {
      break;
    }
    const int ready = socket_->WaitReadable(remaining);
    if (ready == 0) {
      break;
    }
    if (ready < 0) {
      return Status(ErrorCode::kConnectionReset,
                    "select() failed: " + std::string(std::strerror(errno)));
    }
    const ssize_t bytes = ::recv(socket_->fd, chunk, sizeof(chunk), 0);
    if (bytes == 0) {
      return Status(ErrorCode::kConnectionReset, "connection closed by peer");
    }
    if (bytes < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      return Status(ErrorCode::kConnectionReset,
                    "recv() failed: " + std::string(std::strerror(errno)));
    }
    buffer_.append(chunk, static_cast<size_t>(bytes));
  }
  std::ostringstream oss;
  oss << "no response to " << CommandKindName(command.kind) << " " << command.parameter
      << " within " << timeout.count() << " ms";
  return Status(ErrorCode::kTimeout, oss.str());
}

}  // namespace avlink
