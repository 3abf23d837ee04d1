// Example: watch zone meters on an Atlas DSP and report device health.
#include "avlink/avlink.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: avlink_meter_monitor <dsp-ip> [zones] [prefix]" << std::endl;
    return 2;
  }
  const int zones = argc > 2 ? std::atoi(argv[2]) : 4;
  const std::string prefix = argc > 3 ? argv[3] : "ZoneMeter_";

  avlink::DeviceEndpoint dsp;
  dsp.id = "dsp";
  dsp.name = "Atlas DSP";
  dsp.address = argv[1];
  dsp.port = avlink::kAtlasControlPort;
  dsp.kind = avlink::ProtocolKind::kAtlas;
  avlink::StaticDeviceDirectory directory({dsp});

  avlink::ControlPlaneConfig config;
  config.telemetry.cache_ttl = std::chrono::milliseconds(500);
  config.health.check_interval = std::chrono::seconds(10);
  avlink::ControlPlane plane(config, directory);
  plane.health().SetEventCallback([](const avlink::HealthEvent& event) {
    std::cout << "health " << event.device_id << ": "
              << avlink::HealthStateName(event.from) << " -> "
              << avlink::HealthStateName(event.to);
    if (event.to == avlink::HealthState::kReconnecting) {
      std::cout << " attempt=" << event.attempt << " in " << event.backoff.count() << "ms";
    }
    if (!event.error.ok()) {
      std::cout << " (" << event.error.ToString() << ")";
    }
    std::cout << std::endl;
  });

  if (!plane.Start()) {
    std::cerr << "Failed to start control plane: " << plane.GetLastError() << std::endl;
    return 1;
  }
  for (int i = 0; i < zones; ++i) {
    const avlink::Status status = plane.telemetry().EnsureSubscribed(dsp.id, prefix + std::to_string(i));
    if (!status.ok()) {
      std::cerr << "subscribe " << prefix << i << ": " << status.ToString() << std::endl;
    }
  }

  std::atomic<bool> done{false};
  std::thread printer([&]() {
    std::cout << std::fixed << std::setprecision(1);
    while (!done.load()) {
      const auto values = plane.telemetry().ReadIndexed(dsp.id, prefix, zones);
      std::cout << "meters:";
      for (const auto& value : values) {
        std::cout << " " << (value.has_value() ? avlink::ParamValueToString(*value) : "--");
      }
      std::cout << std::endl;
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  });

  std::cout << "Monitoring. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  done = true;
  printer.join();

  const auto metrics = plane.telemetry().GetMetrics();
  std::cout << "reads=" << metrics.reads << " cache_hits=" << metrics.cache_hits
            << " round_trips=" << metrics.round_trips << " stale=" << metrics.stale_serves
            << std::endl;
  plane.Stop();
  return 0;
}
