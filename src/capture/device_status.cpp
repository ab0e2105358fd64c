#include "capture/device_status.hpp"

#include "core/json_utils.hpp"

#include <sstream>
#include <utility>

namespace chronosnap::capture {

DeviceStatus MakeInactiveStatus() {
  return DeviceStatus{};
}

DeviceStatus MakeActiveStatus(std::string device_name, const backends::Resolution resolution) {
  DeviceStatus status;
  status.is_active = true;
  status.device_name = std::move(device_name);
  status.resolution = resolution;
  return status;
}

DeviceStatus SnapshotStatus(const backends::ICaptureDevice* device) {
  if (device == nullptr || !device->IsOpen()) {
    return MakeInactiveStatus();
  }
  std::optional<std::string> name = device->DeviceName();
  const std::optional<backends::Resolution> resolution = device->NegotiatedResolution();
  if (!name.has_value() || !resolution.has_value()) {
    return MakeInactiveStatus();
  }
  return MakeActiveStatus(std::move(name.value()), resolution.value());
}

bool IsConsistent(const DeviceStatus& status) {
  return status.is_active == (status.device_name.has_value() && status.resolution.has_value());
}

std::string ToJson(const DeviceStatus& status) {
  std::ostringstream out;
  out << "{\"is_active\":" << (status.is_active ? "true" : "false")
      << ",\"device_name\":"
      << core::QuoteJsonOrNull(status.device_name)
      << ",\"resolution\":";
  if (status.resolution.has_value()) {
    out << '[' << status.resolution->width << ',' << status.resolution->height << ']';
  } else {
    out << "null";
  }
  out << '}';
  return out.str();
}

} // namespace chronosnap::capture
