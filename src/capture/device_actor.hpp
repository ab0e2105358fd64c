#pragma once

#include "backends/capture_device.hpp"
#include "capture/command_queue.hpp"
#include "capture/device_command.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace chronosnap::capture {

struct ActorOptions {
  backends::Resolution preferred_resolution{.width = 1920, .height = 1080};
};

// Sole owner of the capture-device handle.
//
// State machine:
// - Closed --start--> Open (or stays Closed when the open fails)
// - Open --start--> previous handle released first, then the new one opened
// - any --stop--> Closed (always succeeds; release errors are logged)
// - Open --capture--> Open, Closed --capture--> DEVICE_NOT_STARTED
// - any --get_status--> unchanged
//
// Not thread-safe. `Run` must be the only caller of `Handle`, and both must run
// on the single worker thread.
class DeviceActor {
public:
  DeviceActor(std::shared_ptr<backends::ICaptureDeviceFactory> factory,
              core::logging::Logger& logger,
              ActorOptions options = {});
  ~DeviceActor();

  DeviceActor(const DeviceActor&) = delete;
  DeviceActor& operator=(const DeviceActor&) = delete;

  // Processes commands in arrival order until the queue is closed and drained,
  // then releases any open device.
  void Run(CommandQueue& queue);

  // Executes one command to completion and fulfils its reply channel.
  void Handle(DeviceCommand& command);

  std::size_t commands_handled() const { return commands_handled_; }

private:
  StatusReply HandleStart(const std::optional<std::string>& device_id);
  StopReply HandleStop();
  CaptureReply HandleCapture(int quality);
  StatusReply HandleGetStatus() const;

  std::size_t ResolveCaptureIndex(const std::optional<std::string>& device_id);
  void ReleaseBestEffort(const char* reason);

  std::shared_ptr<backends::ICaptureDeviceFactory> factory_;
  core::logging::Logger& logger_;
  ActorOptions options_;
  std::unique_ptr<backends::ICaptureDevice> device_;
  std::size_t commands_handled_ = 0;
};

} // namespace chronosnap::capture
