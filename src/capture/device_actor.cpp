#include "capture/device_actor.hpp"

#include "backends/webcam/device_enumeration.hpp"
#include "codec/frame_codec.hpp"
#include "core/errors/device_error.hpp"

#include <exception>
#include <future>
#include <string>
#include <utility>

namespace chronosnap::capture {

namespace {

using core::errors::DeviceErrorCode;
using core::errors::FormatDeviceError;

std::string FormatResolution(const std::optional<backends::Resolution>& resolution) {
  if (!resolution.has_value()) {
    return "";
  }
  return std::to_string(resolution->width) + "x" + std::to_string(resolution->height);
}

// An issuer that timed out has dropped its future; the promise still accepts
// the value and it is discarded. Only an already-satisfied channel throws.
template <typename Reply>
void Deliver(std::promise<Reply>& channel, Reply reply, core::logging::Logger& logger,
             const char* command_name) {
  try {
    channel.set_value(std::move(reply));
  } catch (const std::future_error& ex) {
    logger.Warn("reply channel rejected value",
                {{"command", command_name}, {"error", ex.what()}});
  }
}

template <typename Reply>
void DeliverFailure(std::promise<Reply>& channel, std::string error,
                    core::logging::Logger& logger, const char* command_name) {
  Reply reply;
  reply.ok = false;
  reply.error = std::move(error);
  Deliver(channel, std::move(reply), logger, command_name);
}

} // namespace

DeviceActor::DeviceActor(std::shared_ptr<backends::ICaptureDeviceFactory> factory,
                         core::logging::Logger& logger,
                         ActorOptions options)
    : factory_(std::move(factory)), logger_(logger), options_(options) {}

DeviceActor::~DeviceActor() {
  ReleaseBestEffort("actor destroyed");
}

void DeviceActor::Run(CommandQueue& queue) {
  logger_.Info("device worker started");
  DeviceCommand command;
  while (queue.Pop(command)) {
    Handle(command);
  }
  ReleaseBestEffort("shutdown");
  logger_.Info("device worker stopped",
               {{"commands_handled", std::to_string(commands_handled_)}});
}

void DeviceActor::Handle(DeviceCommand& command) {
  const char* name = CommandName(command);
  logger_.Debug("dispatching device command", {{"command", name}});
  ++commands_handled_;

  if (auto* start = std::get_if<StartCommand>(&command)) {
    try {
      Deliver(start->reply, HandleStart(start->device_id), logger_, name);
    } catch (const std::exception& ex) {
      logger_.Error("start handler raised", {{"error", ex.what()}});
      DeliverFailure(start->reply, FormatDeviceError(DeviceErrorCode::kUnknown, ex.what()),
                     logger_, name);
    }
    return;
  }
  if (auto* stop = std::get_if<StopCommand>(&command)) {
    try {
      Deliver(stop->reply, HandleStop(), logger_, name);
    } catch (const std::exception& ex) {
      logger_.Error("stop handler raised", {{"error", ex.what()}});
      DeliverFailure(stop->reply, FormatDeviceError(DeviceErrorCode::kUnknown, ex.what()),
                     logger_, name);
    }
    return;
  }
  if (auto* capture = std::get_if<CaptureCommand>(&command)) {
    try {
      Deliver(capture->reply, HandleCapture(capture->quality), logger_, name);
    } catch (const std::exception& ex) {
      logger_.Error("capture handler raised", {{"error", ex.what()}});
      DeliverFailure(capture->reply, FormatDeviceError(DeviceErrorCode::kUnknown, ex.what()),
                     logger_, name);
    }
    return;
  }
  if (auto* get_status = std::get_if<GetStatusCommand>(&command)) {
    try {
      Deliver(get_status->reply, HandleGetStatus(), logger_, name);
    } catch (const std::exception& ex) {
      logger_.Error("get_status handler raised", {{"error", ex.what()}});
      DeliverFailure(get_status->reply, FormatDeviceError(DeviceErrorCode::kUnknown, ex.what()),
                     logger_, name);
    }
  }
}

StatusReply DeviceActor::HandleStart(const std::optional<std::string>& device_id) {
  StatusReply reply;
  if (device_ != nullptr && device_->IsOpen()) {
    ReleaseBestEffort("superseded by start");
  }
  device_.reset();

  const std::size_t capture_index = ResolveCaptureIndex(device_id);
  std::unique_ptr<backends::ICaptureDevice> device = factory_->CreateDevice();
  if (device == nullptr) {
    reply.error = FormatDeviceError(DeviceErrorCode::kUnknown,
                                    "capture backend could not create a device handle");
    logger_.Error("device start failed", {{"error", reply.error}});
    return reply;
  }

  std::string error;
  if (!device->Open(capture_index, options_.preferred_resolution, error)) {
    reply.error = error;
    logger_.Warn("device start failed",
                 {{"capture_index", std::to_string(capture_index)}, {"error", error}});
    return reply;
  }

  device_ = std::move(device);
  reply.status = SnapshotStatus(device_.get());
  reply.ok = true;
  logger_.Info("device started",
               {{"capture_index", std::to_string(capture_index)},
                {"device_name", reply.status.device_name.value_or("")},
                {"resolution", FormatResolution(reply.status.resolution)}});
  return reply;
}

StopReply DeviceActor::HandleStop() {
  const bool was_open = device_ != nullptr && device_->IsOpen();
  ReleaseBestEffort("stop");
  if (was_open) {
    logger_.Info("device stopped");
  }
  StopReply reply;
  reply.ok = true;
  return reply;
}

CaptureReply DeviceActor::HandleCapture(const int quality) {
  CaptureReply reply;
  if (device_ == nullptr || !device_->IsOpen()) {
    reply.error = FormatDeviceError(DeviceErrorCode::kDeviceNotStarted, "Device not started");
    return reply;
  }

  backends::RawFrame frame;
  std::string error;
  if (!device_->ReadFrame(frame, error)) {
    reply.error = error;
    logger_.Warn("frame acquisition failed", {{"error", error}});
    return reply;
  }
  if (!codec::EncodeFrameToDataUri(frame, quality, reply.data_uri, error)) {
    reply.data_uri.clear();
    reply.error = error;
    logger_.Warn("frame encode failed",
                 {{"layout", backends::ToString(frame.layout)}, {"error", error}});
    return reply;
  }

  reply.ok = true;
  logger_.Debug("frame captured",
                {{"quality", std::to_string(quality)},
                 {"bytes", std::to_string(reply.data_uri.size())}});
  return reply;
}

StatusReply DeviceActor::HandleGetStatus() const {
  StatusReply reply;
  reply.status = SnapshotStatus(device_.get());
  reply.ok = true;
  return reply;
}

std::size_t DeviceActor::ResolveCaptureIndex(const std::optional<std::string>& device_id) {
  if (!device_id.has_value() || device_id->empty()) {
    return 0;
  }
  std::size_t index = 0;
  if (!backends::webcam::ParseCaptureIndex(device_id.value(), index)) {
    logger_.Warn("unrecognized device id, falling back to capture index 0",
                 {{"device_id", device_id.value()}});
    return 0;
  }
  return index;
}

void DeviceActor::ReleaseBestEffort(const char* reason) {
  if (device_ == nullptr) {
    return;
  }
  std::string error;
  if (!device_->Close(error)) {
    logger_.Warn("device release failed", {{"reason", reason}, {"error", error}});
  }
  device_.reset();
}

} // namespace chronosnap::capture
