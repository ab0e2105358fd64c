#include "../common/assertions.hpp"
#include "backends/webcam/testing/fake_capture_device.hpp"
#include "capture/actor_registry.hpp"
#include "capture/device_controller.hpp"
#include "codec/frame_codec.hpp"
#include "core/errors/device_error.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using chronosnap::backends::CaptureDeviceInfo;
using chronosnap::backends::webcam::testing::FakeCaptureDeviceFactory;
using chronosnap::backends::webcam::testing::FakeDeviceSpec;
using chronosnap::capture::ActorRegistry;
using chronosnap::capture::DeviceController;
using chronosnap::capture::DeviceStatus;
using chronosnap::capture::IsConsistent;
using chronosnap::core::errors::DeviceErrorCode;
using chronosnap::core::errors::ParseDeviceErrorCode;
using chronosnap::core::logging::LogLevel;
using chronosnap::core::logging::Logger;
using chronosnap::tests::common::AssertContains;
using chronosnap::tests::common::Fail;

std::shared_ptr<FakeCaptureDeviceFactory> MakeFactory() {
  return std::make_shared<FakeCaptureDeviceFactory>(std::vector<FakeDeviceSpec>{
      FakeDeviceSpec{.name = "Desk Camera"},
      FakeDeviceSpec{.name = "Door Camera", .max_resolution = {.width = 320, .height = 240}},
  });
}

void AssertFacadeLifecycle() {
  auto factory = MakeFactory();
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);
  ActorRegistry registry(factory, logger);
  DeviceController controller(registry, factory, logger);

  std::string error;
  std::string data_uri;

  // Capture before start.
  if (controller.Capture(std::nullopt, data_uri, error) ||
      error != "DEVICE_NOT_STARTED: Device not started") {
    Fail("capture before start should fail with DEVICE_NOT_STARTED, got: " + error);
  }

  // Start, status, capture, stop.
  DeviceStatus status;
  if (!controller.Start(std::nullopt, status, error)) {
    Fail("start should succeed: " + error);
  }
  if (!status.is_active || status.device_name != std::optional<std::string>("Desk Camera")) {
    Fail("start should report the first device as active");
  }
  DeviceStatus queried;
  if (!controller.Status(queried, error) || !queried.is_active || !IsConsistent(queried)) {
    Fail("status after start should be active and consistent");
  }
  if (!controller.Capture(std::nullopt, data_uri, error)) {
    Fail("capture after start should succeed: " + error);
  }
  AssertContains(data_uri, chronosnap::codec::kJpegDataUriPrefix);

  std::string preview_uri;
  if (!controller.Preview(preview_uri, error)) {
    Fail("preview should succeed: " + error);
  }
  AssertContains(preview_uri, chronosnap::codec::kJpegDataUriPrefix);

  // The same pattern compressed at a lower quality produces a smaller payload.
  std::string low_uri;
  std::string high_uri;
  if (!controller.Capture(10, low_uri, error) || !controller.Capture(100, high_uri, error)) {
    Fail("explicit quality captures should succeed: " + error);
  }
  if (low_uri.size() >= high_uri.size()) {
    Fail("quality 10 should yield a smaller JPEG than quality 100");
  }

  // Restart on another device.
  if (!controller.Start(std::string("1"), status, error) ||
      status.device_name != std::optional<std::string>("Door Camera")) {
    Fail("restart on device 1 should succeed: " + error);
  }
  if (factory->probe()->max_open_handles.load() != 1U) {
    Fail("restart must release the previous device first");
  }

  if (!controller.Stop(error) || !controller.Stop(error)) {
    Fail("stop should succeed twice: " + error);
  }
  if (!controller.Status(queried, error) || queried.is_active || !IsConsistent(queried)) {
    Fail("status after stop should be inactive");
  }
  if (queried.device_name.has_value() || queried.resolution.has_value()) {
    Fail("inactive status must not carry name or resolution");
  }
}

void AssertListDevicesRunsWithoutWorker() {
  auto factory = MakeFactory();
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);
  ActorRegistry registry(factory, logger);
  DeviceController controller(registry, factory, logger);

  std::vector<CaptureDeviceInfo> devices;
  std::string error;
  if (!controller.ListDevices(devices, error)) {
    Fail("list devices should succeed: " + error);
  }
  if (devices.size() != 2U || devices[0].id != "0" || devices[1].name != "Door Camera") {
    Fail("list devices returned unexpected entries");
  }
  if (registry.DebugSnapshot().workers_spawned != 0U) {
    Fail("listing devices must not spawn the worker");
  }
}

void AssertCallsAfterShutdownFail() {
  auto factory = MakeFactory();
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);
  ActorRegistry registry(factory, logger);
  DeviceController controller(registry, factory, logger);

  DeviceStatus status;
  std::string error;
  if (!controller.Start(std::nullopt, status, error)) {
    Fail("start should succeed: " + error);
  }
  registry.Shutdown();
  if (controller.Status(status, error) ||
      ParseDeviceErrorCode(error) != DeviceErrorCode::kCommandChannelClosed) {
    Fail("status after shutdown should report COMMAND_CHANNEL_CLOSED, got: " + error);
  }
  if (factory->probe()->open_handles.load() != 0U) {
    Fail("shutdown should release the device");
  }
}

// Many callers issuing random operations: the worker must serialize all
// device access and every observed status must be internally consistent.
void AssertConcurrentCallersAreSerialized() {
  auto factory = MakeFactory();
  std::ostringstream log_sink;
  Logger logger(LogLevel::kWarn, log_sink);
  ActorRegistry registry(factory, logger);
  DeviceController controller(registry, factory, logger);

  constexpr int kThreads = 8;
  constexpr int kOpsPerThread = 40;
  std::mutex failures_mu;
  std::vector<std::string> failures;
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      std::mt19937 rng(static_cast<std::mt19937::result_type>(1234 + t));
      std::uniform_int_distribution<int> pick(0, 3);
      for (int i = 0; i < kOpsPerThread; ++i) {
        std::string error;
        std::string failure;
        switch (pick(rng)) {
        case 0: {
          DeviceStatus status;
          const std::optional<std::string> id =
              (i % 2 == 0) ? std::optional<std::string>("0") : std::optional<std::string>("1");
          if (!controller.Start(id, status, error)) {
            failure = "start failed: " + error;
          } else if (!status.is_active || !IsConsistent(status)) {
            failure = "start returned an inconsistent status";
          }
          break;
        }
        case 1:
          if (!controller.Stop(error)) {
            failure = "stop failed: " + error;
          }
          break;
        case 2: {
          std::string data_uri;
          if (!controller.Capture(std::nullopt, data_uri, error) &&
              ParseDeviceErrorCode(error) != DeviceErrorCode::kDeviceNotStarted) {
            failure = "capture failed unexpectedly: " + error;
          }
          break;
        }
        default: {
          DeviceStatus status;
          if (!controller.Status(status, error)) {
            failure = "status failed: " + error;
          } else if (!IsConsistent(status)) {
            failure = "status was inconsistent";
          }
          break;
        }
        }
        if (!failure.empty()) {
          std::lock_guard<std::mutex> lock(failures_mu);
          failures.push_back(std::move(failure));
        }
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  if (!failures.empty()) {
    Fail("concurrent caller failure: " + failures.front());
  }
  if (factory->probe()->max_in_flight.load() > 1U) {
    Fail("device handles were entered concurrently");
  }
  if (factory->probe()->max_open_handles.load() > 1U) {
    Fail("more than one device handle was open at once");
  }
  if (registry.DebugSnapshot().workers_spawned != 1U) {
    Fail("concurrent callers must share one worker");
  }
}

} // namespace

int main() {
  AssertFacadeLifecycle();
  AssertListDevicesRunsWithoutWorker();
  AssertCallsAfterShutdownFail();
  AssertConcurrentCallersAreSerialized();

  std::cout << "device_controller_smoke: ok\n";
  return 0;
}
