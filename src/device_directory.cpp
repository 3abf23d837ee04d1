#include "avlink/device_directory.h"

#include <algorithm>

namespace avlink {

StaticDeviceDirectory::StaticDeviceDirectory(const std::vector<DeviceEndpoint>& endpoints) {
  for (const auto& endpoint : endpoints) {
    devices_[endpoint.id] = endpoint;
  }
}

void StaticDeviceDirectory::Upsert(const DeviceEndpoint& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_[endpoint.id] = endpoint;
}

bool StaticDeviceDirectory::Remove(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.erase(device_id) > 0;
}

std::optional<DeviceEndpoint> StaticDeviceDirectory::Lookup(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> StaticDeviceDirectory::ListDeviceIds() const {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ids.reserve(devices_.size());
    for (const auto& entry : devices_) {
      ids.push_back(entry.first);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace avlink
