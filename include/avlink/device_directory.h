#pragma once

#include "avlink/types.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace avlink {

/**
 * Read-only view of the device configuration store.
 */
class DeviceDirectory {
 public:
  virtual ~DeviceDirectory() = default;

  /// Return the endpoint registered for a device id, if any.
  virtual std::optional<DeviceEndpoint> Lookup(const std::string& device_id) const = 0;
  /// Return every registered device id.
  virtual std::vector<std::string> ListDeviceIds() const = 0;
};

/**
 * In-memory directory, safe for concurrent readers and writers.
 */
class StaticDeviceDirectory : public DeviceDirectory {
 public:
  StaticDeviceDirectory() = default;
  explicit StaticDeviceDirectory(const std::vector<DeviceEndpoint>& endpoints);

  /// Add or replace the record for endpoint.id.
  void Upsert(const DeviceEndpoint& endpoint);
  /// Remove a record. Returns true if it existed.
  bool Remove(const std::string& device_id);

  std::optional<DeviceEndpoint> Lookup(const std::string& device_id) const override;
  std::vector<std::string> ListDeviceIds() const override;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, DeviceEndpoint> devices_;
};

}  // namespace avlink
