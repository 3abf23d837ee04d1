#include "avlink/cec_control_service.h"

#include <cctype>
#include <cstdio>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace avlink {
namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMaxChannelLength = 8;
constexpr uint8_t kOpcodeUserControlPressed = 0x44;

// Reply markers that show the bus carried the frame.
constexpr const char* kResponseMarkers[] = {
    "TRAFFIC", "<<", ">>", "key pressed", "ACK", "waiting for input",
};

bool ShowsBusActivity(const std::string& reply) {
  for (const char* marker : kResponseMarkers) {
    if (reply.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string KeyFrame(uint8_t source, uint8_t destination, CecKey key) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%X%X:%02X:%02X", source & 0x0f,
                destination & 0x0f, kOpcodeUserControlPressed,
                static_cast<unsigned>(key));
  return buffer;
}

PowerStatus ParsePowerStatus(const std::string& text) {
  std::string lower;
  for (char c : text) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.find("standby to on") != std::string::npos) {
    return PowerStatus::kTransitioningToOn;
  }
  if (lower.find("on to standby") != std::string::npos) {
    return PowerStatus::kTransitioningToStandby;
  }
  if (lower.find("standby") != std::string::npos) {
    return PowerStatus::kStandby;
  }
  if (lower == "on" || lower.find("power on") != std::string::npos) {
    return PowerStatus::kOn;
  }
  return PowerStatus::kUnknown;
}

CecKey DigitKey(char digit) {
  return static_cast<CecKey>(static_cast<uint8_t>(CecKey::kNumber0) + (digit - '0'));
}

}  // namespace

const char* PowerStatusName(PowerStatus status) {
  switch (status) {
    case PowerStatus::kUnknown:
      return "unknown";
    case PowerStatus::kOn:
      return "on";
    case PowerStatus::kStandby:
      return "standby";
    case PowerStatus::kTransitioningToOn:
      return "transitioning_to_on";
    case PowerStatus::kTransitioningToStandby:
      return "transitioning_to_standby";
  }
  return "unknown";
}

bool CecServiceConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (command_timeout.count() <= 0) {
    return fail("command_timeout must be positive");
  }
  if (max_retries < 0) {
    return fail("max_retries must not be negative");
  }
  if (retry_delay.count() < 0 || inter_key_delay.count() < 0) {
    return fail("delays must not be negative");
  }
  if (source_logical_address > 0x0f) {
    return fail("source_logical_address must be 0-15");
  }
  return true;
}

bool ValidateChannel(const std::string& channel, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (channel.empty()) {
    return fail("channel must not be empty");
  }
  if (channel.size() > kMaxChannelLength) {
    return fail("channel '" + channel + "' is longer than 8 characters");
  }
  bool seen_separator = false;
  bool digits_in_part = false;
  for (char c : channel) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits_in_part = true;
      continue;
    }
    if ((c == '.' || c == '-') && !seen_separator && digits_in_part) {
      seen_separator = true;
      digits_in_part = false;
      continue;
    }
    return fail("channel '" + channel + "' must be digits with an optional '.' or '-'");
  }
  if (!digits_in_part) {
    return fail("channel '" + channel + "' must end with a digit");
  }
  return true;
}

struct CecControlService::Impl {
  Impl(CecServiceConfig cfg, ConnectionRegistry& reg, const DeviceDirectory& dir)
      : config(std::move(cfg)),
        registry(reg),
        directory(dir),
        logger("cec", config.log_callback, config.log_level) {}

  std::mutex& DeviceLock(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(locks_mutex);
    auto& slot = device_locks[device_id];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    return *slot;
  }

  Status Resolve(const std::string& device_id, DeviceEndpoint* out) {
    auto endpoint = directory.Lookup(device_id);
    if (!endpoint.has_value()) {
      return Status(ErrorCode::kDeviceNotFound, "unknown device " + device_id);
    }
    if (endpoint->kind != ProtocolKind::kCecBridge) {
      return Status(ErrorCode::kValidationError,
                    "device " + device_id + " is not a CEC device");
    }
    *out = *endpoint;
    return Status::Ok();
  }

  // One logical command, retried according to its idempotency.
  Status Exchange(const DeviceEndpoint& endpoint, Command command, bool idempotent,
                  CommandResult* result, Response* last_response) {
    command.timeout = config.command_timeout;
    const int max_attempts = 1 + config.max_retries;
    Status status;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
      result->attempts++;
      ConnectionHandle handle;
      status = registry.Acquire(endpoint, &handle);
      if (status.ok()) {
        Response response;
        status = handle->SendCommand(command, &response);
        if (status.code != ErrorCode::kConnectionError &&
            status.code != ErrorCode::kValidationError) {
          result->command_sent = true;
        }
        if (status.ok()) {
          if (!result->output.empty()) {
            result->output += "\n";
          }
          result->output += response.raw;
          result->device_responded =
              result->device_responded || ShowsBusActivity(response.raw);
          if (last_response) {
            *last_response = std::move(response);
          }
          return status;
        }
      }
      const bool retryable =
          status.code == ErrorCode::kConnectionError ||
          (idempotent && (status.code == ErrorCode::kTimeout ||
                          status.code == ErrorCode::kConnectionReset));
      if (!retryable || attempt == max_attempts) {
        break;
      }
      logger.Debug("retry", status.ToString(),
                   {{"device", endpoint.id},
                    {"parameter", command.parameter},
                    {"attempt", std::to_string(attempt)}});
      handle.Release();
      std::this_thread::sleep_for(config.retry_delay);
    }
    return status;
  }

  Status PressKey(const DeviceEndpoint& endpoint, CecKey key, CommandResult* result) {
    const std::string frame =
        KeyFrame(config.source_logical_address, endpoint.cec_logical_address, key);
    return Exchange(endpoint, Command::Set("tx", frame), false, result, nullptr);
  }

  void Finish(const char* operation, const std::string& device_id, Clock::time_point start,
              CommandResult* result) {
    result->execution_time =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    Logger::Fields fields = {{"device", device_id},
                             {"operation", operation},
                             {"attempts", std::to_string(result->attempts)},
                             {"elapsed_ms", std::to_string(result->execution_time.count())}};
    if (result->ok()) {
      logger.Info("command", std::string(operation) + " ok", fields);
    } else {
      logger.Warn("command", std::string(operation) + " failed: " + result->error.ToString(),
                  fields);
    }
  }

  CommandResult Power(const std::string& device_id, bool on) {
    const auto start = Clock::now();
    const char* operation = on ? "power_on" : "power_off";
    CommandResult result;
    DeviceEndpoint endpoint;
    result.error = Resolve(device_id, &endpoint);
    if (result.ok()) {
      std::lock_guard<std::mutex> lock(DeviceLock(device_id));
      result.error = Exchange(endpoint, Command::Set(on ? "on" : "standby", ParamValue{}),
                              true, &result, nullptr);
    }
    Finish(operation, device_id, start, &result);
    return result;
  }

  CecServiceConfig config;
  ConnectionRegistry& registry;
  const DeviceDirectory& directory;
  Logger logger;

  std::mutex locks_mutex;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> device_locks;
};

CecControlService::CecControlService(CecServiceConfig config, ConnectionRegistry& registry,
                                     const DeviceDirectory& directory)
    : impl_(new Impl(std::move(config), registry, directory)) {}

CecControlService::~CecControlService() = default;

CommandResult CecControlService::PowerOn(const std::string& device_id) {
  return impl_->Power(device_id, true);
}

CommandResult CecControlService::PowerOff(const std::string& device_id) {
  return impl_->Power(device_id, false);
}

CommandResult CecControlService::SendKey(const std::string& device_id, CecKey key) {
  const auto start = Clock::now();
  CommandResult result;
  DeviceEndpoint endpoint;
  result.error = impl_->Resolve(device_id, &endpoint);
  if (result.ok()) {
    std::lock_guard<std::mutex> lock(impl_->DeviceLock(device_id));
    result.error = impl_->PressKey(endpoint, key, &result);
  }
  impl_->Finish("send_key", device_id, start, &result);
  return result;
}

CommandResult CecControlService::TuneChannel(const std::string& device_id,
                                             const std::string& channel) {
  const auto start = Clock::now();
  CommandResult result;
  std::string error;
  if (!ValidateChannel(channel, &error)) {
    result.error = Status(ErrorCode::kValidationError, error);
    impl_->Finish("tune", device_id, start, &result);
    return result;
  }
  DeviceEndpoint endpoint;
  result.error = impl_->Resolve(device_id, &endpoint);
  if (!result.ok()) {
    impl_->Finish("tune", device_id, start, &result);
    return result;
  }

  std::lock_guard<std::mutex> lock(impl_->DeviceLock(device_id));
  for (size_t i = 0; i < channel.size(); ++i) {
    if (i > 0) {
      std::this_thread::sleep_for(impl_->config.inter_key_delay);
    }
    const char c = channel[i];
    const bool digit = std::isdigit(static_cast<unsigned char>(c)) != 0;
    const CecKey key = digit ? DigitKey(c) : CecKey::kDot;
    result.error = impl_->PressKey(endpoint, key, &result);
    if (!result.ok()) {
      impl_->logger.Warn("tune", "stopped after " + std::to_string(i) + " of " +
                                     std::to_string(channel.size()) + " keys",
                         {{"device", device_id}, {"channel", channel}});
      impl_->Finish("tune", device_id, start, &result);
      return result;
    }
    if (digit) {
      result.digits_sent++;
    }
  }
  if (impl_->config.confirm_with_enter) {
    std::this_thread::sleep_for(impl_->config.inter_key_delay);
    result.error = impl_->PressKey(endpoint, CecKey::kEnter, &result);
  }
  impl_->Finish("tune", device_id, start, &result);
  return result;
}

PowerStatusResult CecControlService::GetPowerStatus(const std::string& device_id) {
  const auto start = Clock::now();
  PowerStatusResult status;
  DeviceEndpoint endpoint;
  status.result.error = impl_->Resolve(device_id, &endpoint);
  if (status.result.ok()) {
    std::lock_guard<std::mutex> lock(impl_->DeviceLock(device_id));
    Response response;
    status.result.error = impl_->Exchange(endpoint, Command::Get("power"), true,
                                          &status.result, &response);
    if (status.result.ok()) {
      status.status = ParsePowerStatus(ParamValueToString(response.value));
    }
  }
  impl_->Finish("power_status", device_id, start, &status.result);
  return status;
}

}  // namespace avlink
