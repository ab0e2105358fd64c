#pragma once

#include "capture/device_status.hpp"

#include <future>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace chronosnap::capture {

inline constexpr int kDefaultCaptureQuality = 90;
inline constexpr int kPreviewCaptureQuality = 60;

// Replies carry either a value (`ok == true`) or a "<CODE>: message" error.
struct StatusReply {
  bool ok = false;
  DeviceStatus status;
  std::string error;
};

struct StopReply {
  bool ok = false;
  std::string error;
};

struct CaptureReply {
  bool ok = false;
  std::string data_uri;
  std::string error;
};

// Every command owns the single-use channel its issuer is waiting on.
struct StartCommand {
  static constexpr const char* kName = "start";
  std::optional<std::string> device_id;
  std::promise<StatusReply> reply;
};

struct StopCommand {
  static constexpr const char* kName = "stop";
  std::promise<StopReply> reply;
};

struct CaptureCommand {
  static constexpr const char* kName = "capture";
  int quality = kDefaultCaptureQuality;
  std::promise<CaptureReply> reply;
};

struct GetStatusCommand {
  static constexpr const char* kName = "get_status";
  std::promise<StatusReply> reply;
};

using DeviceCommand = std::variant<StartCommand, StopCommand, CaptureCommand, GetStatusCommand>;

inline const char* CommandName(const DeviceCommand& command) {
  return std::visit([](const auto& typed) { return std::decay_t<decltype(typed)>::kName; },
                    command);
}

} // namespace chronosnap::capture
