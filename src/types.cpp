#include "avlink/types.h"

#include <cmath>
#include <sstream>

namespace avlink {

const char* ProtocolKindName(ProtocolKind kind) {
  switch (kind) {
    case ProtocolKind::kAtlas:
      return "atlas";
    case ProtocolKind::kGlobalCache:
      return "globalcache";
    case ProtocolKind::kCecBridge:
      return "cec";
  }
  return "unknown";
}

std::string DeviceEndpoint::Key() const {
  return address + ":" + std::to_string(port);
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "Ok";
    case ErrorCode::kConnectionError:
      return "ConnectionError";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kConnectionReset:
      return "ConnectionReset";
    case ErrorCode::kProtocolError:
      return "ProtocolError";
    case ErrorCode::kDeviceNotFound:
      return "DeviceNotFound";
    case ErrorCode::kValidationError:
      return "ValidationError";
  }
  return "Unknown";
}

std::string Status::ToString() const {
  if (ok()) {
    return "Ok";
  }
  std::string text = ErrorCodeName(code);
  if (!message.empty()) {
    text += ": ";
    text += message;
  }
  return text;
}

const char* ValueFormatName(ValueFormat format) {
  switch (format) {
    case ValueFormat::kVal:
      return "val";
    case ValueFormat::kPct:
      return "pct";
    case ValueFormat::kStr:
      return "str";
  }
  return "val";
}

bool HasValue(const ParamValue& value) {
  return !std::holds_alternative<std::monostate>(value);
}

std::string ParamValueToString(const ParamValue& value) {
  if (const auto* number = std::get_if<double>(&value)) {
    // Integral values print without a fractional part ("3", not "3.000000").
    if (std::isfinite(*number) && std::floor(*number) == *number &&
        std::fabs(*number) < 1e15) {
      return std::to_string(static_cast<long long>(*number));
    }
    std::ostringstream oss;
    oss << *number;
    return oss.str();
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  return {};
}

const char* CommandKindName(CommandKind kind) {
  switch (kind) {
    case CommandKind::kGet:
      return "get";
    case CommandKind::kSet:
      return "set";
    case CommandKind::kSubscribe:
      return "sub";
    case CommandKind::kUnsubscribe:
      return "unsub";
  }
  return "get";
}

Command Command::Get(std::string parameter, ValueFormat format) {
  Command command;
  command.kind = CommandKind::kGet;
  command.parameter = std::move(parameter);
  command.format = format;
  return command;
}

Command Command::Set(std::string parameter, ParamValue value, ValueFormat format) {
  Command command;
  command.kind = CommandKind::kSet;
  command.parameter = std::move(parameter);
  command.value = std::move(value);
  command.format = format;
  return command;
}

Command Command::Subscribe(std::string parameter, ValueFormat format) {
  Command command;
  command.kind = CommandKind::kSubscribe;
  command.parameter = std::move(parameter);
  command.format = format;
  return command;
}

Command Command::Unsubscribe(std::string parameter, ValueFormat format) {
  Command command;
  command.kind = CommandKind::kUnsubscribe;
  command.parameter = std::move(parameter);
  command.format = format;
  return command;
}

const char* ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kBusy:
      return "busy";
    case ConnectionState::kErrored:
      return "errored";
  }
  return "unknown";
}

}  // namespace avlink
