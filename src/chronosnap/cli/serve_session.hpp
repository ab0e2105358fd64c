#pragma once

#include "capture/device_controller.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string_view>

namespace chronosnap::cli {

// Line-oriented request/response loop for a front-end process.
//
// One request per input line, one JSON reply per output line:
//   {"ok":true,"result":<value>}   or   {"ok":false,"error":"<CODE>: message"}
//
// Requests:
//   list_devices | start [id] | stop | status | capture [quality] | preview
//   save_file <dir> <name> <base64> | check_dir <dir> | quit
//
// Blank lines are ignored. The loop ends on `quit` or end of input.
struct ServeSessionStats {
  std::size_t requests = 0;
  std::size_t failures = 0;
};

ServeSessionStats RunServeSession(std::istream& in, std::ostream& out,
                                  capture::DeviceController& controller,
                                  core::logging::Logger& logger);

// Accepts any base-10 int; range is left to the encoder.
bool ParseQualityArgument(std::string_view raw, int& quality);

} // namespace chronosnap::cli
