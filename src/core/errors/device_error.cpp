#include "core/errors/device_error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <string>
#include <utility>

namespace chronosnap::core::errors {

namespace {

constexpr std::array<DeviceErrorCode, 11> kKnownCodes = {
    DeviceErrorCode::kDeviceNotFound,
    DeviceErrorCode::kDeviceBusy,
    DeviceErrorCode::kFormatNegotiationFailed,
    DeviceErrorCode::kDeviceNotStarted,
    DeviceErrorCode::kFrameAcquisitionFailed,
    DeviceErrorCode::kDecodeFailed,
    DeviceErrorCode::kEncodeFailed,
    DeviceErrorCode::kCommandChannelClosed,
    DeviceErrorCode::kRequestTimedOut,
    DeviceErrorCode::kInvalidRequest,
    DeviceErrorCode::kStorageFailed,
};

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (needle.empty()) {
      continue;
    }
    if (haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string_view ToStableErrorCode(const DeviceErrorCode code) {
  switch (code) {
  case DeviceErrorCode::kDeviceNotFound:
    return "DEVICE_NOT_FOUND";
  case DeviceErrorCode::kDeviceBusy:
    return "DEVICE_BUSY";
  case DeviceErrorCode::kFormatNegotiationFailed:
    return "FORMAT_NEGOTIATION_FAILED";
  case DeviceErrorCode::kDeviceNotStarted:
    return "DEVICE_NOT_STARTED";
  case DeviceErrorCode::kFrameAcquisitionFailed:
    return "FRAME_ACQUISITION_FAILED";
  case DeviceErrorCode::kDecodeFailed:
    return "DECODE_FAILED";
  case DeviceErrorCode::kEncodeFailed:
    return "ENCODE_FAILED";
  case DeviceErrorCode::kCommandChannelClosed:
    return "COMMAND_CHANNEL_CLOSED";
  case DeviceErrorCode::kRequestTimedOut:
    return "REQUEST_TIMED_OUT";
  case DeviceErrorCode::kInvalidRequest:
    return "INVALID_REQUEST";
  case DeviceErrorCode::kStorageFailed:
    return "STORAGE_FAILED";
  case DeviceErrorCode::kUnknown:
  default:
    return "UNKNOWN";
  }
}

std::string FormatDeviceError(const DeviceErrorCode code, std::string_view message) {
  return std::string(ToStableErrorCode(code)) + ": " + std::string(message);
}

DeviceErrorCode ParseDeviceErrorCode(std::string_view error) {
  const std::size_t colon = error.find(':');
  if (colon == std::string_view::npos) {
    return DeviceErrorCode::kUnknown;
  }
  const std::string_view prefix = error.substr(0, colon);
  for (const DeviceErrorCode code : kKnownCodes) {
    if (ToStableErrorCode(code) == prefix) {
      return code;
    }
  }
  return DeviceErrorCode::kUnknown;
}

DeviceErrorCode ClassifyOpenFailure(std::string_view detail) {
  const std::string normalized = ToLowerAscii(std::string(detail));
  if (ContainsAny(normalized, {"no such file", "no such device", "not found", "not present",
                               "no capture device", "out of range"})) {
    return DeviceErrorCode::kDeviceNotFound;
  }
  return DeviceErrorCode::kDeviceBusy;
}

} // namespace chronosnap::core::errors
