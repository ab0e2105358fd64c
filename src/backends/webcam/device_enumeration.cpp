#include "backends/webcam/device_enumeration.hpp"
#include "backends/webcam/linux/v4l2_device_enumerator.hpp"
#include "backends/webcam/opencv_webcam_impl.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace chronosnap::backends::webcam {

namespace {

struct FixtureRow {
  std::string device_id;
  std::string friendly_name;
  std::string bus_info;
  std::optional<std::size_t> capture_index;
};

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }

  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> SplitSimpleCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  current.reserve(line.size());
  for (char c : line) {
    if (c == ',') {
      fields.push_back(Trim(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  fields.push_back(Trim(current));
  return fields;
}

bool ParseNonNegativeIndex(std::string_view raw, std::size_t& parsed_index) {
  if (raw.empty()) {
    return false;
  }
  std::size_t parsed = 0;
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }
  parsed_index = parsed;
  return true;
}

std::size_t ResolveProbeLimit() {
  constexpr std::size_t kDefaultProbeLimit = 8;
  const char* env = std::getenv(kMaxProbeIndexEnvVar);
  if (env == nullptr || *env == '\0') {
    return kDefaultProbeLimit;
  }

  std::size_t parsed = 0;
  if (!ParseNonNegativeIndex(env, parsed)) {
    return kDefaultProbeLimit;
  }
  return parsed;
}

bool ParseFixtureRow(const std::string& line, std::size_t line_number, FixtureRow& row,
                     std::string& error) {
  const std::vector<std::string> fields = SplitSimpleCsvLine(line);
  if (fields.size() < 2U) {
    error = "webcam fixture parse error at line " + std::to_string(line_number) +
            ": expected at least 2 CSV fields (device_id,friendly_name)";
    return false;
  }
  row.device_id = fields[0];
  row.friendly_name = fields[1];
  row.bus_info = fields.size() >= 3U ? fields[2] : "";
  row.capture_index.reset();
  if (ToLower(row.device_id) == "device_id" && ToLower(row.friendly_name) == "friendly_name") {
    return true;
  }
  if (fields.size() >= 4U && !fields[3].empty()) {
    std::size_t parsed_index = 0;
    if (!ParseNonNegativeIndex(fields[3], parsed_index)) {
      error = "webcam fixture parse error at line " + std::to_string(line_number) +
              ": capture_index must be a non-negative integer";
      return false;
    }
    row.capture_index = parsed_index;
  }
  return true;
}

bool LooksLikeHeader(const FixtureRow& row) {
  return ToLower(row.device_id) == "device_id" && ToLower(row.friendly_name) == "friendly_name";
}

void StableSortDevices(std::vector<WebcamDeviceInfo>& devices) {
  std::stable_sort(devices.begin(), devices.end(),
                   [](const WebcamDeviceInfo& left, const WebcamDeviceInfo& right) {
                     if (left.capture_index.has_value() && right.capture_index.has_value() &&
                         left.capture_index.value() != right.capture_index.value()) {
                       return left.capture_index.value() < right.capture_index.value();
                     }
                     if (left.capture_index.has_value() != right.capture_index.has_value()) {
                       return left.capture_index.has_value();
                     }
                     return left.device_id < right.device_id;
                   });
}

WebcamDeviceInfo MapFixtureRowToDevice(const FixtureRow& row) {
  WebcamDeviceInfo device;
  device.device_id = row.device_id;
  device.friendly_name = row.friendly_name;
  const std::string bus_info = Trim(row.bus_info);
  if (!bus_info.empty()) {
    device.bus_info = bus_info;
  }
  device.capture_index = row.capture_index;
  if (!device.capture_index.has_value()) {
    std::size_t parsed = 0;
    if (ParseCaptureIndex(device.device_id, parsed)) {
      device.capture_index = parsed;
    }
  }
  return device;
}

WebcamDeviceInfo MakeOpenCvDiscoveredDevice(const std::size_t index) {
  WebcamDeviceInfo device;
  device.device_id = "opencv-index-" + std::to_string(index);
  device.friendly_name = "Camera " + std::to_string(index);
  device.bus_info = "opencv:index:" + std::to_string(index);
  device.capture_index = index;
  return device;
}

bool LoadFixtureDevices(const char* fixture_path, std::vector<WebcamDeviceInfo>& devices,
                        std::string& error) {
  std::ifstream input(fs::path(fixture_path), std::ios::binary);
  if (!input) {
    error = std::string("unable to open ") + kDeviceFixtureEnvVar +
            " file: " + std::string(fixture_path);
    return false;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed.rfind('#', 0U) == 0U) {
      continue;
    }

    FixtureRow row;
    if (!ParseFixtureRow(trimmed, line_number, row, error)) {
      return false;
    }
    if (LooksLikeHeader(row)) {
      continue;
    }

    const WebcamDeviceInfo mapped = MapFixtureRowToDevice(row);
    if (mapped.device_id.empty()) {
      error = "webcam fixture parse error at line " + std::to_string(line_number) +
              ": device_id must be non-empty";
      return false;
    }
    if (mapped.friendly_name.empty()) {
      error = "webcam fixture parse error at line " + std::to_string(line_number) +
              ": friendly_name must be non-empty";
      return false;
    }
    devices.push_back(mapped);
  }
  return true;
}

} // namespace

bool ParseCaptureIndex(std::string_view device_id, std::size_t& index) {
  std::string trimmed = Trim(device_id);
  std::string_view view(trimmed);
  if (view.rfind("/dev/", 0U) == 0U) {
    view.remove_prefix(5U);
  }
  if (const std::optional<std::size_t> video_index = ParseVideoIndex(view);
      video_index.has_value()) {
    index = video_index.value();
    return true;
  }
  return ParseNonNegativeIndex(view, index);
}

std::optional<WebcamDeviceInfo> FindDeviceByCaptureIndex(
    const std::vector<WebcamDeviceInfo>& devices, const std::size_t capture_index) {
  for (const WebcamDeviceInfo& device : devices) {
    if (device.capture_index.has_value() && device.capture_index.value() == capture_index) {
      return device;
    }
  }
  return std::nullopt;
}

CaptureIndexLookup LookupCaptureIndex(const std::size_t capture_index, WebcamDeviceInfo& device) {
  const char* fixture_path = std::getenv(kDeviceFixtureEnvVar);
  if (fixture_path != nullptr && *fixture_path != '\0') {
    std::vector<WebcamDeviceInfo> devices;
    std::string error;
    if (!LoadFixtureDevices(fixture_path, devices, error)) {
      return CaptureIndexLookup::kUnknown;
    }
    const std::optional<WebcamDeviceInfo> found = FindDeviceByCaptureIndex(devices, capture_index);
    if (!found.has_value()) {
      return CaptureIndexLookup::kAbsent;
    }
    device = found.value();
    return CaptureIndexLookup::kFound;
  }

#if defined(__linux__)
  bool node_exists = false;
  if (QueryV4l2CaptureNode(capture_index, device, node_exists)) {
    return CaptureIndexLookup::kFound;
  }
  return node_exists ? CaptureIndexLookup::kUnknown : CaptureIndexLookup::kAbsent;
#else
  return CaptureIndexLookup::kUnknown;
#endif
}

bool EnumerateConnectedDevices(std::vector<WebcamDeviceInfo>& devices, std::string& error) {
  devices.clear();
  error.clear();

  const char* fixture_path = std::getenv(kDeviceFixtureEnvVar);
  if (fixture_path != nullptr && *fixture_path != '\0') {
    if (!LoadFixtureDevices(fixture_path, devices, error)) {
      devices.clear();
      return false;
    }
  } else {
#if defined(__linux__)
    // Prefer native Linux discovery so device names are the V4L2 card names
    // rather than synthesized index labels.
    std::vector<WebcamDeviceInfo> v4l2_devices;
    std::string v4l2_error;
    if (EnumerateV4l2Devices(v4l2_devices, v4l2_error) && !v4l2_devices.empty()) {
      devices = std::move(v4l2_devices);
    } else
#endif
    {
      const std::size_t probe_limit = ResolveProbeLimit();
      const std::vector<std::size_t> discovered_indices =
          OpenCvWebcamImpl::EnumerateDeviceIndices(probe_limit);
      devices.reserve(discovered_indices.size());
      for (const std::size_t index : discovered_indices) {
        devices.push_back(MakeOpenCvDiscoveredDevice(index));
      }
    }
  }

  StableSortDevices(devices);
  return true;
}

} // namespace chronosnap::backends::webcam
