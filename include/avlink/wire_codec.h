#pragma once

#include "avlink/types.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace avlink {

/**
 * Outcome of decoding one received frame.
 */
enum class DecodeResult {
  kResponse,     // reply to the outstanding command
  kUpdate,       // unsolicited push for a subscribed parameter
  kIgnored,      // well-formed frame with no meaning for the client
  kMalformed,    // frame could not be parsed
  kDeviceError,  // device rejected the command
};

/**
 * Translates abstract commands to and from one device wire protocol.
 *
 * Codecs are stateless apart from request ids, and are only used by the
 * protocol client that owns them, so they need no locking.
 */
class WireCodec {
 public:
  virtual ~WireCodec() = default;

  virtual ProtocolKind kind() const = 0;

  /**
   * Encode a command into one wire frame including its terminator.
   *
   * @param error Set when the command cannot be expressed in this protocol.
   * @return false if the command is not supported (nothing must be written).
   */
  virtual bool Encode(const Command& command, std::string* out, std::string* error) = 0;

  /// Whether the protocol answers this command at all.
  virtual bool ExpectsResponse(const Command& command) const = 0;

  /// Pop the next complete frame (terminator stripped) from the receive buffer.
  std::optional<std::string> ExtractFrame(std::string* buffer) const;

  /**
   * Decode a frame received while `command` is outstanding.
   *
   * Exactly one of response/update is filled depending on the result. On
   * kMalformed and kDeviceError, `error` describes the problem.
   */
  virtual DecodeResult Decode(const std::string& frame, Response* response,
                              ParameterUpdate* update, std::string* error) const = 0;

  /// Lightweight command used for liveness checks.
  virtual Command PingCommand() const = 0;

  /// Default per-command timeout for this device class.
  virtual std::chrono::milliseconds DefaultTimeout() const = 0;

  /// Whether the protocol supports subscriptions with pushed updates.
  virtual bool SupportsSubscriptions() const = 0;

 protected:
  /// Frame terminator byte ('\n' or '\r').
  virtual char terminator() const = 0;
};

/**
 * Create the codec for an endpoint's protocol kind.
 */
std::unique_ptr<WireCodec> MakeCodec(const DeviceEndpoint& endpoint);

}  // namespace avlink
