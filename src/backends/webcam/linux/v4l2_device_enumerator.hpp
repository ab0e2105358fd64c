#pragma once

#include "backends/webcam/device_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronosnap::backends::webcam {

// Enumerates Linux webcam devices using V4L2 `VIDIOC_QUERYCAP`.
//
// Contract:
// - returns `true` on successful scan (including zero devices found)
// - returns `false` only for hard scan/setup errors
// - skips nodes without video-capture capability (UVC metadata nodes)
// - emits rows ordered by `/dev/videoN` index
bool EnumerateV4l2Devices(std::vector<WebcamDeviceInfo>& devices, std::string& error);

// Queries only `/dev/video<index>`. `node_exists` reports whether the node is
// present at all; `false` return with `node_exists` set means the node exists
// but is not a queryable video-capture device.
bool QueryV4l2CaptureNode(std::size_t index, WebcamDeviceInfo& device, bool& node_exists);

// Parses the N out of `videoN`.
std::optional<std::size_t> ParseVideoIndex(std::string_view device_name);

} // namespace chronosnap::backends::webcam
