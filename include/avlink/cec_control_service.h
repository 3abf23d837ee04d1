#pragma once

#include "avlink/connection_registry.h"
#include "avlink/device_directory.h"
#include "avlink/logging.h"
#include "avlink/types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace avlink {

/**
 * CEC user control codes (operand of <User Control Pressed>, opcode 0x44).
 */
enum class CecKey : uint8_t {
  kSelect = 0x00,
  kUp = 0x01,
  kDown = 0x02,
  kLeft = 0x03,
  kRight = 0x04,
  kExit = 0x0d,
  kNumber0 = 0x20,
  kNumber1 = 0x21,
  kNumber2 = 0x22,
  kNumber3 = 0x23,
  kNumber4 = 0x24,
  kNumber5 = 0x25,
  kNumber6 = 0x26,
  kNumber7 = 0x27,
  kNumber8 = 0x28,
  kNumber9 = 0x29,
  kDot = 0x2a,
  kEnter = 0x2b,
  kChannelUp = 0x30,
  kChannelDown = 0x31,
  kPreviousChannel = 0x32,
  kPower = 0x40,
  kVolumeUp = 0x41,
  kVolumeDown = 0x42,
  kMute = 0x43,
  kPlay = 0x44,
  kStop = 0x45,
  kPause = 0x46,
  kGuide = 0x53,
  kPowerOffFunction = 0x6c,
  kPowerOnFunction = 0x6d,
};

enum class PowerStatus {
  kUnknown,
  kOn,
  kStandby,
  kTransitioningToOn,
  kTransitioningToStandby,
};

const char* PowerStatusName(PowerStatus status);

/**
 * Outcome of one CEC command.
 */
struct CommandResult {
  /// At least one frame was written to the device.
  bool command_sent = false;
  /// A reply showed bus traffic or an acknowledgement.
  bool device_responded = false;
  Status error;
  /// Exchanges attempted, retries included.
  int attempts = 0;
  std::chrono::milliseconds execution_time{0};
  /// Channel digits delivered by TuneChannel. The separator key is not counted.
  int digits_sent = 0;
  /// Raw reply lines, newline separated.
  std::string output;

  bool ok() const { return error.ok(); }
};

struct PowerStatusResult {
  CommandResult result;
  PowerStatus status = PowerStatus::kUnknown;
};

struct CecServiceConfig {
  /// Timeout of each bridge exchange.
  std::chrono::milliseconds command_timeout{5000};
  /// Extra attempts after the first for retryable failures.
  int max_retries = 2;
  std::chrono::milliseconds retry_delay{500};
  /// Pause between the key presses of a channel number.
  std::chrono::milliseconds inter_key_delay{250};
  /// Press Enter after the channel digits.
  bool confirm_with_enter = false;
  /// Logical address the bridge transmits from (1 = recording device 1).
  uint8_t source_logical_address = 1;
  /// Optional structured log sink (defaults to stderr).
  LogCallback log_callback;
  LogLevel log_level = LogLevel::kInfo;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Check a channel string: digits with an optional '.' or '-' sub-channel
 * separator followed by digits, at most 8 characters.
 */
bool ValidateChannel(const std::string& channel, std::string* error = nullptr);

/**
 * Power and remote-key control of CEC devices through a network CEC bridge.
 *
 * Power commands are idempotent and retry on timeouts and connection
 * failures. Key presses retry only when nothing was written. Operations on
 * one device run one at a time, so the key presses of two channel changes
 * never interleave.
 */
class CecControlService {
 public:
  CecControlService(CecServiceConfig config, ConnectionRegistry& registry,
                    const DeviceDirectory& directory);
  ~CecControlService();

  CecControlService(const CecControlService&) = delete;
  CecControlService& operator=(const CecControlService&) = delete;

  CommandResult PowerOn(const std::string& device_id);
  CommandResult PowerOff(const std::string& device_id);
  CommandResult SendKey(const std::string& device_id, CecKey key);
  /**
   * Enter a channel number, one key press per character.
   *
   * A failure part way leaves the already delivered keys in place; the
   * result reports digits_sent and the error that stopped the sequence.
   */
  CommandResult TuneChannel(const std::string& device_id, const std::string& channel);
  PowerStatusResult GetPowerStatus(const std::string& device_id);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace avlink
