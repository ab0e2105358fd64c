#include "capture/device_controller.hpp"

#include "capture/command_queue.hpp"
#include "capture/device_command.hpp"
#include "core/errors/device_error.hpp"

#include <future>
#include <utility>

namespace chronosnap::capture {

namespace {

using core::errors::DeviceErrorCode;
using core::errors::FormatDeviceError;

// Send one command and wait for its reply within `timeout`.
template <typename Command, typename Reply>
bool Call(ActorRegistry& registry, core::logging::Logger& logger, Command command,
          const std::chrono::milliseconds timeout, Reply& reply, std::string& error) {
  error.clear();
  CommandSender sender;
  if (!registry.EnsureStarted(sender, error)) {
    return false;
  }

  std::future<Reply> future = command.reply.get_future();
  if (!sender.Send(DeviceCommand(std::move(command)), error)) {
    return false;
  }

  if (future.wait_for(timeout) != std::future_status::ready) {
    const std::string bound_ms = std::to_string(timeout.count());
    logger.Warn("device request timed out",
                {{"command", Command::kName}, {"timeout_ms", bound_ms}});
    error = FormatDeviceError(DeviceErrorCode::kRequestTimedOut,
                              std::string(Command::kName) + " did not complete within " +
                                  bound_ms + " ms");
    return false;
  }

  try {
    reply = future.get();
  } catch (const std::future_error& ex) {
    error = FormatDeviceError(DeviceErrorCode::kCommandChannelClosed,
                              std::string("device worker dropped the ") + Command::kName +
                                  " reply: " + ex.what());
    return false;
  }
  return true;
}

} // namespace

DeviceController::DeviceController(ActorRegistry& registry,
                                   std::shared_ptr<backends::ICaptureDeviceFactory> factory,
                                   core::logging::Logger& logger,
                                   ControllerTimeouts timeouts)
    : registry_(registry), factory_(std::move(factory)), logger_(logger), timeouts_(timeouts) {}

bool DeviceController::ListDevices(std::vector<backends::CaptureDeviceInfo>& devices,
                                   std::string& error) const {
  devices.clear();
  error.clear();
  if (factory_ == nullptr) {
    error = FormatDeviceError(DeviceErrorCode::kUnknown, "no capture backend configured");
    return false;
  }
  std::string enumerate_error;
  if (!factory_->EnumerateDevices(devices, enumerate_error)) {
    error = FormatDeviceError(DeviceErrorCode::kUnknown, enumerate_error);
    return false;
  }
  return true;
}

bool DeviceController::Start(const std::optional<std::string>& device_id, DeviceStatus& status,
                             std::string& error) {
  StartCommand command;
  command.device_id = device_id;
  StatusReply reply;
  if (!Call(registry_, logger_, std::move(command), timeouts_.lifecycle, reply, error)) {
    return false;
  }
  if (!reply.ok) {
    error = reply.error;
    return false;
  }
  status = reply.status;
  return true;
}

bool DeviceController::Stop(std::string& error) {
  StopReply reply;
  if (!Call(registry_, logger_, StopCommand{}, timeouts_.lifecycle, reply, error)) {
    return false;
  }
  if (!reply.ok) {
    error = reply.error;
    return false;
  }
  return true;
}

bool DeviceController::Status(DeviceStatus& status, std::string& error) {
  StatusReply reply;
  if (!Call(registry_, logger_, GetStatusCommand{}, timeouts_.query, reply, error)) {
    return false;
  }
  if (!reply.ok) {
    error = reply.error;
    return false;
  }
  status = reply.status;
  return true;
}

bool DeviceController::Capture(const std::optional<int> quality, std::string& data_uri,
                               std::string& error) {
  CaptureCommand command;
  command.quality = quality.value_or(kDefaultCaptureQuality);
  CaptureReply reply;
  if (!Call(registry_, logger_, std::move(command), timeouts_.query, reply, error)) {
    return false;
  }
  if (!reply.ok) {
    error = reply.error;
    return false;
  }
  data_uri = std::move(reply.data_uri);
  return true;
}

bool DeviceController::Preview(std::string& data_uri, std::string& error) {
  return Capture(kPreviewCaptureQuality, data_uri, error);
}

} // namespace chronosnap::capture
