#include "../common/assertions.hpp"
#include "backends/webcam/testing/fake_capture_device.hpp"
#include "capture/command_queue.hpp"
#include "capture/device_actor.hpp"
#include "codec/frame_codec.hpp"
#include "core/errors/device_error.hpp"
#include "core/logging/logger.hpp"

#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace {

using chronosnap::backends::ICaptureDevice;
using chronosnap::backends::ICaptureDeviceFactory;
using chronosnap::backends::CaptureDeviceInfo;
using chronosnap::backends::PixelLayout;
using chronosnap::backends::webcam::testing::FakeCaptureDeviceFactory;
using chronosnap::backends::webcam::testing::FakeDeviceProbe;
using chronosnap::backends::webcam::testing::FakeDeviceSpec;
using chronosnap::capture::CaptureCommand;
using chronosnap::capture::CaptureReply;
using chronosnap::capture::CommandQueue;
using chronosnap::capture::DeviceActor;
using chronosnap::capture::DeviceCommand;
using chronosnap::capture::GetStatusCommand;
using chronosnap::capture::IsConsistent;
using chronosnap::capture::StartCommand;
using chronosnap::capture::StatusReply;
using chronosnap::capture::StopCommand;
using chronosnap::capture::StopReply;
using chronosnap::core::errors::DeviceErrorCode;
using chronosnap::core::errors::ParseDeviceErrorCode;
using chronosnap::core::logging::LogLevel;
using chronosnap::core::logging::Logger;
using chronosnap::tests::common::AssertContains;
using chronosnap::tests::common::Fail;

std::vector<FakeDeviceSpec> TwoDevices() {
  return {
      FakeDeviceSpec{.name = "Front Camera"},
      FakeDeviceSpec{.name = "Rear Camera", .max_resolution = {.width = 320, .height = 240}},
  };
}

// Synchronous helpers: Handle runs to completion, so the reply is ready on
// return.
StatusReply Start(DeviceActor& actor, std::optional<std::string> device_id) {
  StartCommand command;
  command.device_id = std::move(device_id);
  std::future<StatusReply> reply = command.reply.get_future();
  DeviceCommand wrapped(std::move(command));
  actor.Handle(wrapped);
  return reply.get();
}

StopReply Stop(DeviceActor& actor) {
  StopCommand command;
  std::future<StopReply> reply = command.reply.get_future();
  DeviceCommand wrapped(std::move(command));
  actor.Handle(wrapped);
  return reply.get();
}

CaptureReply Capture(DeviceActor& actor, int quality) {
  CaptureCommand command;
  command.quality = quality;
  std::future<CaptureReply> reply = command.reply.get_future();
  DeviceCommand wrapped(std::move(command));
  actor.Handle(wrapped);
  return reply.get();
}

StatusReply Status(DeviceActor& actor) {
  GetStatusCommand command;
  std::future<StatusReply> reply = command.reply.get_future();
  DeviceCommand wrapped(std::move(command));
  actor.Handle(wrapped);
  return reply.get();
}

void ExpectCode(const std::string& error, DeviceErrorCode expected, std::string_view context) {
  if (ParseDeviceErrorCode(error) != expected) {
    Fail(std::string(context) + ": unexpected error '" + error + "'");
  }
}

void AssertCaptureRequiresStart() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);

  const CaptureReply reply = Capture(actor, 90);
  if (reply.ok) {
    Fail("capture without start must fail");
  }
  if (reply.error != "DEVICE_NOT_STARTED: Device not started") {
    Fail("unexpected not-started error: " + reply.error);
  }
  if (factory->probe()->frame_reads.load() != 0U || factory->probe()->devices_created.load() != 0U) {
    Fail("capture while closed must not touch the device");
  }
}

void AssertStopIsIdempotent() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);

  if (!Stop(actor).ok || !Stop(actor).ok) {
    Fail("stop on a closed device must succeed every time");
  }
  if (Status(actor).status.is_active) {
    Fail("stop must leave the device closed");
  }

  if (!Start(actor, std::nullopt).ok) {
    Fail("start should succeed");
  }
  if (!Stop(actor).ok || !Stop(actor).ok) {
    Fail("stop after start must succeed twice");
  }
  if (Status(actor).status.is_active || factory->probe()->open_handles.load() != 0U) {
    Fail("stop must release the handle");
  }
}

void AssertStartCaptureLifecycle() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);

  const StatusReply started = Start(actor, std::nullopt);
  if (!started.ok || !started.status.is_active || !IsConsistent(started.status)) {
    Fail("start(None) should open capture index 0: " + started.error);
  }
  if (started.status.device_name != std::optional<std::string>("Front Camera")) {
    Fail("start(None) should report the first device's name");
  }
  if (started.status.resolution->width != 640U || started.status.resolution->height != 480U) {
    Fail("negotiated resolution should be clamped to the device maximum");
  }

  const CaptureReply captured = Capture(actor, 90);
  if (!captured.ok) {
    Fail("capture after start should succeed: " + captured.error);
  }
  AssertContains(captured.data_uri, chronosnap::codec::kJpegDataUriPrefix);
  if (captured.data_uri.size() <= chronosnap::codec::kJpegDataUriPrefix.size()) {
    Fail("capture payload must not be empty");
  }

  AssertContains(log_sink.str(), "msg=\"device started\"");
  AssertContains(log_sink.str(), "device_name=\"Front Camera\"");
  AssertContains(log_sink.str(), "resolution=\"640x480\"");
}

void AssertRestartSupersedesPreviousDevice() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);

  if (!Start(actor, std::string("0")).ok) {
    Fail("start(0) should succeed");
  }
  const StatusReply second = Start(actor, std::string("1"));
  if (!second.ok) {
    Fail("start(1) should succeed: " + second.error);
  }
  const StatusReply status = Status(actor);
  if (status.status.device_name != std::optional<std::string>("Rear Camera")) {
    Fail("status should report the superseding device");
  }
  if (factory->probe()->max_open_handles.load() != 1U) {
    Fail("previous device must be released before the next one opens");
  }
  if (factory->probe()->open_handles.load() != 1U) {
    Fail("exactly one handle should remain open");
  }

  // `/dev/videoN` and `videoN` resolve to the same index.
  if (Start(actor, std::string("/dev/video0")).status.device_name !=
      std::optional<std::string>("Front Camera")) {
    Fail("/dev/video0 should open capture index 0");
  }
  if (Start(actor, std::string("video1")).status.device_name !=
      std::optional<std::string>("Rear Camera")) {
    Fail("video1 should open capture index 1");
  }
}

void AssertUnparseableIdFallsBackToZero() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);

  const StatusReply reply = Start(actor, std::string("usb-cam-xyz"));
  if (!reply.ok || reply.status.device_name != std::optional<std::string>("Front Camera")) {
    Fail("unrecognized id should fall back to capture index 0");
  }
  AssertContains(log_sink.str(), "level=WARN");
  AssertContains(log_sink.str(), "device_id=\"usb-cam-xyz\"");
}

void AssertStartFailuresLeaveDeviceClosed() {
  std::vector<FakeDeviceSpec> specs = TwoDevices();
  specs.push_back(FakeDeviceSpec{.name = "Busy Camera", .open_fails = true});
  specs.push_back(FakeDeviceSpec{.name = "Odd Camera", .negotiation_fails = true});
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(specs);
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);

  if (!Start(actor, std::string("0")).ok) {
    Fail("start(0) should succeed");
  }

  const StatusReply busy = Start(actor, std::string("2"));
  ExpectCode(busy.error, DeviceErrorCode::kDeviceBusy, "busy device");
  if (busy.ok || Status(actor).status.is_active) {
    Fail("a failed start after an open device must leave the actor closed");
  }

  const StatusReply odd = Start(actor, std::string("3"));
  ExpectCode(odd.error, DeviceErrorCode::kFormatNegotiationFailed, "negotiation failure");

  const StatusReply missing = Start(actor, std::string("9"));
  ExpectCode(missing.error, DeviceErrorCode::kDeviceNotFound, "missing device");

  if (Status(actor).status.is_active || factory->probe()->open_handles.load() != 0U) {
    Fail("failed starts must not leave a handle open");
  }
  ExpectCode(Capture(actor, 90).error, DeviceErrorCode::kDeviceNotStarted, "capture after failure");
}

void AssertCaptureFailuresKeepDeviceOpen() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  const std::shared_ptr<FakeDeviceProbe>& probe = factory->probe();
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);
  (void)Start(actor, std::nullopt);

  probe->fail_acquisition = true;
  ExpectCode(Capture(actor, 90).error, DeviceErrorCode::kFrameAcquisitionFailed, "acquisition");
  probe->fail_acquisition = false;

  probe->corrupt_frames = true;
  ExpectCode(Capture(actor, 90).error, DeviceErrorCode::kDecodeFailed, "raw decode");
  probe->layout = PixelLayout::kMjpeg;
  ExpectCode(Capture(actor, 90).error, DeviceErrorCode::kDecodeFailed, "mjpeg decode");
  probe->corrupt_frames = false;

  if (!Status(actor).status.is_active) {
    Fail("capture failures must leave the device open");
  }

  for (const PixelLayout layout : {PixelLayout::kBgr24, PixelLayout::kRgb24, PixelLayout::kGray8,
                                   PixelLayout::kYuyv, PixelLayout::kMjpeg}) {
    probe->layout = layout;
    const CaptureReply reply = Capture(actor, 75);
    if (!reply.ok) {
      Fail(std::string("capture should succeed for layout ") +
           chronosnap::backends::ToString(layout) + ": " + reply.error);
    }
  }
}

void AssertReleaseFailuresAreSwallowed() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);
  factory->probe()->fail_close = true;

  (void)Start(actor, std::string("0"));
  if (!Start(actor, std::string("1")).ok) {
    Fail("a failed release must not block the superseding start");
  }
  if (!Stop(actor).ok) {
    Fail("stop must succeed even when release fails");
  }
  if (Status(actor).status.is_active) {
    Fail("stop must leave the actor closed after a failed release");
  }
  AssertContains(log_sink.str(), "msg=\"device release failed\"");
  AssertContains(log_sink.str(), "reason=\"superseded by start\"");
  AssertContains(log_sink.str(), "reason=\"stop\"");
}

class ThrowingFactory final : public ICaptureDeviceFactory {
public:
  std::unique_ptr<ICaptureDevice> CreateDevice() override {
    throw std::runtime_error("driver stack exploded");
  }
  bool EnumerateDevices(std::vector<CaptureDeviceInfo>& devices,
                        std::string& error) const override {
    devices.clear();
    error.clear();
    return true;
  }
};

void AssertHandlerExceptionsDoNotKillTheActor() {
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(std::make_shared<ThrowingFactory>(), logger);

  const StatusReply reply = Start(actor, std::nullopt);
  ExpectCode(reply.error, DeviceErrorCode::kUnknown, "throwing start");
  AssertContains(reply.error, "driver stack exploded");
  if (!Status(actor).ok || !Stop(actor).ok) {
    Fail("the actor must keep serving after a handler throws");
  }
}

void AssertDroppedReplyIsDiscarded() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);

  {
    StartCommand command;
    DeviceCommand wrapped(std::move(command));
    // No future was ever taken; the issuer is gone.
    actor.Handle(wrapped);
  }
  if (!Status(actor).status.is_active) {
    Fail("a command whose issuer vanished must still take effect");
  }
}

void AssertRunDrainsQueueAndReleasesOnShutdown() {
  auto factory = std::make_shared<FakeCaptureDeviceFactory>(TwoDevices());
  std::ostringstream log_sink;
  Logger logger(LogLevel::kDebug, log_sink);
  DeviceActor actor(factory, logger);
  CommandQueue queue;

  StartCommand start;
  std::future<StatusReply> started = start.reply.get_future();
  GetStatusCommand status;
  std::future<StatusReply> status_reply = status.reply.get_future();
  (void)queue.Push(DeviceCommand(std::move(start)));
  (void)queue.Push(DeviceCommand(std::move(status)));
  queue.Close();

  std::thread worker([&actor, &queue] { actor.Run(queue); });
  worker.join();

  if (!started.get().ok || !status_reply.get().status.is_active) {
    Fail("commands queued before close must be served in order");
  }
  if (actor.commands_handled() != 2U) {
    Fail("worker should have handled exactly the queued commands");
  }
  if (factory->probe()->open_handles.load() != 0U) {
    Fail("worker exit must release the open device");
  }
  AssertContains(log_sink.str(), "msg=\"device worker stopped\"");
}

} // namespace

int main() {
  AssertCaptureRequiresStart();
  AssertStopIsIdempotent();
  AssertStartCaptureLifecycle();
  AssertRestartSupersedesPreviousDevice();
  AssertUnparseableIdFallsBackToZero();
  AssertStartFailuresLeaveDeviceClosed();
  AssertCaptureFailuresKeepDeviceOpen();
  AssertReleaseFailuresAreSwallowed();
  AssertHandlerExceptionsDoNotKillTheActor();
  AssertDroppedReplyIsDiscarded();
  AssertRunDrainsQueueAndReleasesOnShutdown();

  std::cout << "device_actor_smoke: ok\n";
  return 0;
}
