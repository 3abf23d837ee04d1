// Example: power and channel control of a TV behind a network CEC bridge.
#include "avlink/avlink.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

int Usage() {
  std::cerr << "usage: avlink_cec_control <bridge-ip> <on|off|status|tune CHANNEL|chup|chdown|mute>"
            << " [logical-address]" << std::endl;
  return 2;
}

void Print(const char* what, const avlink::CommandResult& result) {
  std::cout << what << ": " << (result.ok() ? "ok" : result.error.ToString())
            << " attempts=" << result.attempts
            << " sent=" << (result.command_sent ? "y" : "n")
            << " responded=" << (result.device_responded ? "y" : "n")
            << " time=" << result.execution_time.count() << "ms";
  if (result.digits_sent > 0) {
    std::cout << " digits=" << result.digits_sent;
  }
  std::cout << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    return Usage();
  }
  const std::string command = argv[2];
  int next = 3;
  std::string channel;
  if (command == "tune") {
    if (argc < 4) {
      return Usage();
    }
    channel = argv[next++];
  }

  avlink::DeviceEndpoint tv;
  tv.id = "tv";
  tv.name = "Lobby TV";
  tv.address = argv[1];
  tv.port = avlink::kCecBridgePort;
  tv.kind = avlink::ProtocolKind::kCecBridge;
  if (argc > next) {
    const int logical = std::atoi(argv[next]);
    if (logical < 0 || logical > 15) {
      std::cerr << "logical address must be 0-15" << std::endl;
      return 2;
    }
    tv.cec_logical_address = static_cast<uint8_t>(logical);
  }

  avlink::StaticDeviceDirectory directory({tv});
  avlink::ControlPlaneConfig config;
  config.enable_health_monitor = false;
  config.enable_telemetry_refresh = false;
  config.cec.confirm_with_enter = command == "tune";

  avlink::ControlPlane plane(config, directory);
  if (!plane.Start()) {
    std::cerr << "Failed to start control plane: " << plane.GetLastError() << std::endl;
    return 1;
  }

  avlink::CecControlService& cec = plane.cec();
  int exit_code = 0;
  if (command == "on") {
    const auto result = cec.PowerOn(tv.id);
    Print("power on", result);
    exit_code = result.ok() ? 0 : 1;
  } else if (command == "off") {
    const auto result = cec.PowerOff(tv.id);
    Print("power off", result);
    exit_code = result.ok() ? 0 : 1;
  } else if (command == "status") {
    const auto status = cec.GetPowerStatus(tv.id);
    Print("status", status.result);
    std::cout << "power: " << avlink::PowerStatusName(status.status) << std::endl;
    exit_code = status.result.ok() ? 0 : 1;
  } else if (command == "tune") {
    std::string error;
    if (!avlink::ValidateChannel(channel, &error)) {
      std::cerr << "bad channel: " << error << std::endl;
      exit_code = 2;
    } else {
      const auto result = cec.TuneChannel(tv.id, channel);
      Print("tune", result);
      exit_code = result.ok() ? 0 : 1;
    }
  } else if (command == "chup" || command == "chdown" || command == "mute") {
    const avlink::CecKey key = command == "chup"     ? avlink::CecKey::kChannelUp
                               : command == "chdown" ? avlink::CecKey::kChannelDown
                                                     : avlink::CecKey::kMute;
    const auto result = cec.SendKey(tv.id, key);
    Print(command.c_str(), result);
    exit_code = result.ok() ? 0 : 1;
  } else {
    exit_code = Usage();
  }

  plane.Stop();
  return exit_code;
}
