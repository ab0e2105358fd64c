#pragma once

#include <string>
#include <string_view>

namespace chronosnap::core::errors {

// Stable classification for every failure a device command can report.
//
// Error values travel as single-line strings ("<STABLE_CODE>: <message>") so
// they can cross the reply channel and the serve protocol unchanged; the code
// prefix keeps them grep-friendly and lets callers branch without parsing the
// human text.
enum class DeviceErrorCode {
  kDeviceNotFound,
  kDeviceBusy,
  kFormatNegotiationFailed,
  kDeviceNotStarted,
  kFrameAcquisitionFailed,
  kDecodeFailed,
  kEncodeFailed,
  kCommandChannelClosed,
  kRequestTimedOut,
  kInvalidRequest,
  kStorageFailed,
  kUnknown,
};

std::string_view ToStableErrorCode(DeviceErrorCode code);

// Returns "<STABLE_CODE>: <message>".
std::string FormatDeviceError(DeviceErrorCode code, std::string_view message);

// Recovers the code from a formatted error line. Lines without a known code
// prefix map to kUnknown.
DeviceErrorCode ParseDeviceErrorCode(std::string_view error);

// Classifies raw open-failure detail (driver/OS text) as busy or not-found.
// Anything that does not look like a missing device is treated as busy, since
// an existing node that refuses to open is almost always held elsewhere or
// blocked by permissions.
DeviceErrorCode ClassifyOpenFailure(std::string_view detail);

} // namespace chronosnap::core::errors
