#pragma once

#include "backends/capture_device.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace chronosnap::backends::webcam {

// Normalized webcam identity gathered by discovery (V4L2, OpenCV probe, or the
// CSV fixture). `capture_index` is the index OpenCV opens for this device.
struct WebcamDeviceInfo {
  std::string device_id;
  std::string friendly_name;
  std::optional<std::string> bus_info;
  std::optional<std::size_t> capture_index;
};

// Front-end row for one discovered webcam. The id is the capture index so a
// later `start(id)` opens the same device; rows without a known capture index
// fall back to their position in the sorted list.
CaptureDeviceInfo ToCaptureDeviceInfo(const WebcamDeviceInfo& device, std::size_t position);

} // namespace chronosnap::backends::webcam
