#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace avlink {

/**
 * Default TCP ports for the supported device protocols.
 */
constexpr uint16_t kAtlasControlPort = 5321;
constexpr uint16_t kGlobalCachePort = 4998;
constexpr uint16_t kCecBridgePort = 9526;

/**
 * Wire protocol spoken by a device. Each kind has its own codec.
 */
enum class ProtocolKind : uint8_t {
  kAtlas,        // AtlasIED Atmosphere DSP, newline-terminated JSON-RPC 2.0
  kGlobalCache,  // Global Cache iTach IR blaster, CR-terminated text
  kCecBridge,    // network-attached cec-client line interface
};

const char* ProtocolKindName(ProtocolKind kind);

/**
 * Network identity of one controllable device, as provided by the
 * configuration store.
 */
struct DeviceEndpoint {
  /// Stable device id used by callers (configuration record id).
  std::string id;
  /// Human readable name, used in logs only.
  std::string name;
  /// IPv4 address or host name of the device.
  std::string address;
  /// TCP port of the device control session.
  uint16_t port = 0;
  /// Wire protocol spoken on the session.
  ProtocolKind kind = ProtocolKind::kAtlas;
  /// Optional credentials passed through to the device (unused by the
  /// built-in protocols).
  std::string credentials;
  /// CEC logical address of the target (0 = TV, 3 = tuner 1, 4 = playback 1).
  uint8_t cec_logical_address = 0;

  /// Session key: one physical session per (address, port).
  std::string Key() const;
};

/**
 * Error taxonomy shared by every layer of the control plane.
 */
enum class ErrorCode {
  kOk,
  kConnectionError,  // cannot establish the socket, or not connected
  kTimeout,          // no response within the command budget
  kConnectionReset,  // socket closed or failed during an exchange
  kProtocolError,    // malformed, unexpected or device-rejected response
  kDeviceNotFound,   // no endpoint registered for the requested id
  kValidationError,  // caller supplied malformed parameters
};

const char* ErrorCodeName(ErrorCode code);

/**
 * Result of an operation: an error code plus a human readable message.
 */
struct Status {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  Status() = default;
  Status(ErrorCode error_code, std::string error_message)
      : code(error_code), message(std::move(error_message)) {}

  bool ok() const { return code == ErrorCode::kOk; }
  std::string ToString() const;

  static Status Ok() { return Status(); }
};

/**
 * Representation requested for a parameter value.
 */
enum class ValueFormat : uint8_t {
  kVal,  // raw value (dB, index, 0/1 flags)
  kPct,  // percentage 0-100
  kStr,  // string
};

const char* ValueFormatName(ValueFormat format);

/**
 * Tagged value carried by commands, responses and cache entries.
 * std::monostate means "no value".
 */
using ParamValue = std::variant<std::monostate, double, std::string>;

bool HasValue(const ParamValue& value);
std::string ParamValueToString(const ParamValue& value);

enum class CommandKind : uint8_t {
  kGet,
  kSet,
  kSubscribe,
  kUnsubscribe,
};

const char* CommandKindName(CommandKind kind);

/**
 * Abstract device command, encoded by the protocol codec of the target.
 */
struct Command {
  CommandKind kind = CommandKind::kGet;
  /// Parameter name (e.g. "ZoneGain_0", "version", "tx").
  std::string parameter;
  /// Value for set commands; empty otherwise.
  ParamValue value;
  ValueFormat format = ValueFormat::kVal;
  /// Per-command timeout. Zero selects the client's default.
  std::chrono::milliseconds timeout{0};

  static Command Get(std::string parameter, ValueFormat format = ValueFormat::kVal);
  static Command Set(std::string parameter, ParamValue value,
                     ValueFormat format = ValueFormat::kVal);
  static Command Subscribe(std::string parameter, ValueFormat format = ValueFormat::kVal);
  static Command Unsubscribe(std::string parameter, ValueFormat format = ValueFormat::kVal);
};

/**
 * Decoded response to a command.
 */
struct Response {
  /// Parameter named in the response, if the protocol reports one.
  std::string parameter;
  /// Extracted value (empty for acknowledgements).
  ParamValue value;
  /// Raw response frame as received.
  std::string raw;
  /// False when the protocol sends no reply for the command (write only).
  bool acknowledged = true;
};

/**
 * Unsolicited value pushed by a device for a subscribed parameter.
 */
struct ParameterUpdate {
  std::string parameter;
  ParamValue value;
  ValueFormat format = ValueFormat::kVal;
};

/**
 * Protocol client connection state.
 */
enum class ConnectionState : uint8_t {
  kDisconnected,
  kConnecting,
  kConnected,
  kBusy,
  kErrored,
};

const char* ConnectionStateName(ConnectionState state);

}  // namespace avlink
