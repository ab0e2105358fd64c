#pragma once

#include "backends/capture_device.hpp"
#include "capture/actor_registry.hpp"
#include "capture/device_status.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chronosnap::capture {

// Reply bounds. A call that exceeds its bound returns REQUEST_TIMED_OUT; the
// command itself is not cancelled and still runs on the worker.
struct ControllerTimeouts {
  std::chrono::milliseconds lifecycle{5000}; // start, stop
  std::chrono::milliseconds query{2000};     // status, capture, preview
};

// Blocking entry points used by the CLI and serve session. Safe to call from
// any number of threads at once; calls are serialized by the worker.
class DeviceController {
public:
  DeviceController(ActorRegistry& registry,
                   std::shared_ptr<backends::ICaptureDeviceFactory> factory,
                   core::logging::Logger& logger,
                   ControllerTimeouts timeouts = {});

  // Stateless; runs on the calling thread.
  bool ListDevices(std::vector<backends::CaptureDeviceInfo>& devices, std::string& error) const;

  bool Start(const std::optional<std::string>& device_id, DeviceStatus& status,
             std::string& error);
  bool Stop(std::string& error);
  bool Status(DeviceStatus& status, std::string& error);

  // `quality` defaults to 90 when absent.
  bool Capture(std::optional<int> quality, std::string& data_uri, std::string& error);

  // Capture at the fixed preview quality (60).
  bool Preview(std::string& data_uri, std::string& error);

  const ControllerTimeouts& timeouts() const { return timeouts_; }

private:
  ActorRegistry& registry_;
  std::shared_ptr<backends::ICaptureDeviceFactory> factory_;
  core::logging::Logger& logger_;
  ControllerTimeouts timeouts_;
};

} // namespace chronosnap::capture
