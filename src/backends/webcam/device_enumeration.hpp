#pragma once

#include "backends/webcam/device_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronosnap::backends::webcam {

// Environment variable naming a CSV fixture that replaces live discovery:
//   device_id,friendly_name[,bus_info[,capture_index]]
// Blank lines, `#` comments and a `device_id,friendly_name` header are skipped.
inline constexpr const char* kDeviceFixtureEnvVar = "CHRONOSNAP_WEBCAM_DEVICE_FIXTURE";

// Highest OpenCV index probed when V4L2 discovery is unavailable or empty.
inline constexpr const char* kMaxProbeIndexEnvVar = "CHRONOSNAP_WEBCAM_MAX_PROBE_INDEX";

// Enumerates webcams from, in order of preference:
// 1) the CSV fixture named by `CHRONOSNAP_WEBCAM_DEVICE_FIXTURE`
// 2) native V4L2 discovery (Linux)
// 3) OpenCV index probing
// Output is sorted by capture index, then device id.
bool EnumerateConnectedDevices(std::vector<WebcamDeviceInfo>& devices, std::string& error);

// Accepts `N`, `videoN` and `/dev/videoN`. Returns false for anything else.
bool ParseCaptureIndex(std::string_view device_id, std::size_t& index);

// Outcome of resolving a single capture index without a full scan.
enum class CaptureIndexLookup {
  kFound,   // identity known
  kAbsent,  // the fixture or /dev proves no such device
  kUnknown, // no source can tell
};

// Resolves one capture index from the fixture (when set) or the single
// `/dev/videoN` node. Never opens OpenCV indices, so it is safe to call while
// the device is held.
CaptureIndexLookup LookupCaptureIndex(std::size_t capture_index, WebcamDeviceInfo& device);

std::optional<WebcamDeviceInfo> FindDeviceByCaptureIndex(
    const std::vector<WebcamDeviceInfo>& devices, std::size_t capture_index);

} // namespace chronosnap::backends::webcam
