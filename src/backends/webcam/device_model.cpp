#include "backends/webcam/device_model.hpp"

#include <string>

namespace chronosnap::backends::webcam {

CaptureDeviceInfo ToCaptureDeviceInfo(const WebcamDeviceInfo& device, const std::size_t position) {
  CaptureDeviceInfo info;
  info.id = std::to_string(device.capture_index.value_or(position));
  info.name = device.friendly_name.empty() ? device.device_id : device.friendly_name;
  return info;
}

} // namespace chronosnap::backends::webcam
