#pragma once

#include "backends/capture_device.hpp"

#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

namespace chronosnap::cli {

// Process-level collaborators for one dispatch. The production entrypoint binds
// the OpenCV webcam factory and the standard streams; tests substitute a fake
// factory and string streams.
struct DispatchContext {
  std::shared_ptr<backends::ICaptureDeviceFactory> factory;
  std::istream* in = nullptr;
  std::ostream* out = nullptr;
  std::ostream* err = nullptr;
};

// Routes `chronosnap` subcommands and returns process exit codes with a stable
// contract for scripts and the kiosk launcher:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => device could not be started
//   21 => frame capture failed
//   30 => storage failed
int Dispatch(int argc, char** argv);

// `args` excludes the program name.
int Dispatch(const std::vector<std::string_view>& args, const DispatchContext& context);

} // namespace chronosnap::cli
