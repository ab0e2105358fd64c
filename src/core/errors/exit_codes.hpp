#pragma once

namespace chronosnap::core::errors {

// Stable process-exit contract for the `chronosnap` CLI.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify device and storage failures so a kiosk launcher
// can branch without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDeviceUnavailable = 20,
  kCaptureFailed = 21,
  kStorageFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace chronosnap::core::errors
