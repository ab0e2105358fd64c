#pragma once

#include "backends/capture_device.hpp"

#include <optional>
#include <string>

namespace chronosnap::capture {

// Caller-facing snapshot of the device. Active exactly when both the name and
// the resolution are known.
struct DeviceStatus {
  bool is_active = false;
  std::optional<std::string> device_name;
  std::optional<backends::Resolution> resolution;
};

DeviceStatus MakeInactiveStatus();
DeviceStatus MakeActiveStatus(std::string device_name, backends::Resolution resolution);

// Reads the handle without mutating it. A handle that is open but cannot name
// both its device and its resolution is reported inactive.
DeviceStatus SnapshotStatus(const backends::ICaptureDevice* device);

bool IsConsistent(const DeviceStatus& status);

// {"is_active":bool,"device_name":string|null,"resolution":[w,h]|null}
std::string ToJson(const DeviceStatus& status);

} // namespace chronosnap::capture
