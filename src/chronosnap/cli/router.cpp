#include "chronosnap/cli/router.hpp"

#include "backends/webcam/webcam_factory.hpp"
#include "capture/actor_registry.hpp"
#include "capture/device_controller.hpp"
#include "capture/device_status.hpp"
#include "chronosnap/cli/serve_session.hpp"
#include "codec/frame_codec.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "storage/file_store.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace chronosnap::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitDeviceUnavailable =
    core::errors::ToInt(core::errors::ExitCode::kDeviceUnavailable);
constexpr int kExitCaptureFailed = core::errors::ToInt(core::errors::ExitCode::kCaptureFailed);
constexpr int kExitStorageFailed = core::errors::ToInt(core::errors::ExitCode::kStorageFailed);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  chronosnap list-devices [--json] [--log-level <debug|info|warn|error>]\n"
      << "  chronosnap snap [--device <id>] [--quality <n>] [--out <dir>] [--name <file>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  chronosnap check-dir <dir> [--log-level <debug|info|warn|error>]\n"
      << "  chronosnap serve [--start-timeout-ms <n>] [--query-timeout-ms <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  chronosnap version\n";
}

struct ListDevicesOptions {
  bool json = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct SnapOptions {
  std::optional<std::string> device_id;
  std::optional<int> quality;
  fs::path output_dir = "captures";
  std::string file_name;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct CheckDirOptions {
  fs::path dir;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

struct ServeOptions {
  capture::ControllerTimeouts timeouts;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

bool ParsePositiveMilliseconds(std::string_view raw, std::chrono::milliseconds& value) {
  if (raw.empty()) {
    return false;
  }
  std::int64_t parsed = 0;
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end || parsed <= 0) {
    return false;
  }
  value = std::chrono::milliseconds(parsed);
  return true;
}

// Shared `--log-level <value>` handling. Returns true when `args[i]` was the
// flag; `i` is advanced past its value.
bool ConsumeLogLevel(const std::vector<std::string_view>& args, std::size_t& i,
                     core::logging::LogLevel& level, bool& ok, std::string& error) {
  if (args[i] != "--log-level") {
    return false;
  }
  if (i + 1 >= args.size()) {
    error = "missing value for --log-level";
    ok = false;
    return true;
  }
  ok = core::logging::ParseLogLevel(args[i + 1], level, error);
  ++i;
  return true;
}

// Fetches the value following `args[i]`, advancing `i`.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

bool ParseListDevicesOptions(const std::vector<std::string_view>& args,
                             ListDevicesOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool ok = true;
    if (ConsumeLogLevel(args, i, options.log_level, ok, error)) {
      if (!ok) {
        return false;
      }
      continue;
    }
    if (args[i] == "--json") {
      options.json = true;
      continue;
    }
    error = "unknown argument for list-devices: " + std::string(args[i]);
    return false;
  }
  return true;
}

bool ParseSnapOptions(const std::vector<std::string_view>& args, SnapOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool ok = true;
    if (ConsumeLogLevel(args, i, options.log_level, ok, error)) {
      if (!ok) {
        return false;
      }
      continue;
    }
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--device") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.device_id = std::string(value);
      continue;
    }
    if (token == "--quality") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      int quality = 0;
      if (!ParseQualityArgument(value, quality)) {
        error = "--quality must be an integer, got '" + std::string(value) + "'";
        return false;
      }
      options.quality = quality;
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--name") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!storage::IsPlainFileName(value)) {
        error = "--name must be a plain file name, got '" + std::string(value) + "'";
        return false;
      }
      options.file_name = std::string(value);
      continue;
    }
    error = "unknown argument for snap: " + std::string(token);
    return false;
  }
  return true;
}

bool ParseCheckDirOptions(const std::vector<std::string_view>& args, CheckDirOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool ok = true;
    if (ConsumeLogLevel(args, i, options.log_level, ok, error)) {
      if (!ok) {
        return false;
      }
      continue;
    }
    const std::string_view token = args[i];
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.dir.empty()) {
      error = "check-dir accepts exactly 1 directory";
      return false;
    }
    options.dir = fs::path(token);
  }
  if (options.dir.empty()) {
    error = "check-dir requires exactly 1 argument: <dir>";
    return false;
  }
  return true;
}

bool ParseServeOptions(const std::vector<std::string_view>& args, ServeOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool ok = true;
    if (ConsumeLogLevel(args, i, options.log_level, ok, error)) {
      if (!ok) {
        return false;
      }
      continue;
    }
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--start-timeout-ms" || token == "--query-timeout-ms") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      std::chrono::milliseconds parsed{0};
      if (!ParsePositiveMilliseconds(value, parsed)) {
        error = std::string(token) + " must be a positive integer, got '" + std::string(value) +
                "'";
        return false;
      }
      if (token == "--start-timeout-ms") {
        options.timeouts.lifecycle = parsed;
      } else {
        options.timeouts.query = parsed;
      }
      continue;
    }
    error = "unknown argument for serve: " + std::string(token);
    return false;
  }
  return true;
}

std::string DefaultCaptureName() {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return "chronosnap_" + std::to_string(now_ms) + ".jpg";
}

int CommandVersion(const std::vector<std::string_view>& args, const DispatchContext& context) {
  if (!args.empty()) {
    *context.err << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  *context.out << "chronosnap " << kVersion << '\n';
  return kExitSuccess;
}

int CommandListDevices(const std::vector<std::string_view>& args,
                       const DispatchContext& context) {
  ListDevicesOptions options;
  std::string error;
  if (!ParseListDevicesOptions(args, options, error)) {
    *context.err << "error: " << error << '\n';
    PrintUsage(*context.err);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level, *context.err);
  capture::ActorRegistry registry(context.factory, logger);
  const capture::DeviceController controller(registry, context.factory, logger);

  std::vector<backends::CaptureDeviceInfo> devices;
  if (!controller.ListDevices(devices, error)) {
    logger.Error("device enumeration failed", {{"error", error}});
    *context.err << "error: " << error << '\n';
    return kExitFailure;
  }

  std::ostream& out = *context.out;
  if (options.json) {
    out << '[';
    for (std::size_t i = 0; i < devices.size(); ++i) {
      out << (i > 0U ? "," : "") << "{\"id\":" << core::QuoteJson(devices[i].id)
          << ",\"name\":" << core::QuoteJson(devices[i].name) << '}';
    }
    out << "]\n";
    return kExitSuccess;
  }

  out << "devices: " << devices.size() << '\n';
  for (const backends::CaptureDeviceInfo& device : devices) {
    out << "- id=" << device.id << " name=" << device.name << '\n';
  }
  return kExitSuccess;
}

int CommandSnap(const std::vector<std::string_view>& args, const DispatchContext& context) {
  SnapOptions options;
  std::string error;
  if (!ParseSnapOptions(args, options, error)) {
    *context.err << "error: " << error << '\n';
    PrintUsage(*context.err);
    return kExitUsage;
  }
  if (options.file_name.empty()) {
    options.file_name = DefaultCaptureName();
  }

  core::logging::Logger logger(options.log_level, *context.err);
  capture::ActorRegistry registry(context.factory, logger);
  capture::DeviceController controller(registry, context.factory, logger);

  capture::DeviceStatus status;
  if (!controller.Start(options.device_id, status, error)) {
    *context.err << "error: " << error << '\n';
    return kExitDeviceUnavailable;
  }

  std::string data_uri;
  const bool captured = controller.Capture(options.quality, data_uri, error);
  std::string stop_error;
  if (!controller.Stop(stop_error)) {
    logger.Warn("device stop after snap failed", {{"error", stop_error}});
  }
  if (!captured) {
    *context.err << "error: " << error << '\n';
    return kExitCaptureFailed;
  }

  std::string mime_type;
  std::vector<std::uint8_t> jpeg;
  if (!codec::DecodeDataUri(data_uri, mime_type, jpeg, error)) {
    *context.err << "error: " << error << '\n';
    return kExitCaptureFailed;
  }

  fs::path written;
  if (!storage::SaveBytesToDisk(options.output_dir, options.file_name, jpeg, written, error)) {
    *context.err << "error: " << error << '\n';
    return kExitStorageFailed;
  }

  logger.Info("snapshot saved",
              {{"device_name", status.device_name.value_or("")},
               {"path", written.string()},
               {"bytes", std::to_string(jpeg.size())}});
  *context.out << "saved: " << written.string() << '\n';
  return kExitSuccess;
}

int CommandCheckDir(const std::vector<std::string_view>& args, const DispatchContext& context) {
  CheckDirOptions options;
  std::string error;
  if (!ParseCheckDirOptions(args, options, error)) {
    *context.err << "error: " << error << '\n';
    PrintUsage(*context.err);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level, *context.err);
  bool writable = false;
  if (!storage::CheckDirectoryWritable(options.dir, writable, error)) {
    logger.Error("directory check failed", {{"dir", options.dir.string()}, {"error", error}});
    *context.err << "error: " << error << '\n';
    return kExitStorageFailed;
  }
  logger.Debug("directory probed",
               {{"dir", options.dir.string()}, {"writable", writable ? "true" : "false"}});
  if (!writable) {
    *context.out << "not writable: " << options.dir.string() << '\n';
    return kExitStorageFailed;
  }
  *context.out << "writable: " << options.dir.string() << '\n';
  return kExitSuccess;
}

int CommandServe(const std::vector<std::string_view>& args, const DispatchContext& context) {
  ServeOptions options;
  std::string error;
  if (!ParseServeOptions(args, options, error)) {
    *context.err << "error: " << error << '\n';
    PrintUsage(*context.err);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level, *context.err);
  capture::ActorRegistry registry(context.factory, logger);
  capture::DeviceController controller(registry, context.factory, logger, options.timeouts);
  (void)RunServeSession(*context.in, *context.out, controller, logger);
  return kExitSuccess;
}

} // namespace

int Dispatch(const std::vector<std::string_view>& args, const DispatchContext& context) {
  if (args.empty()) {
    PrintUsage(*context.err);
    return kExitUsage;
  }

  const std::string_view command = args.front();
  const std::vector<std::string_view> rest(args.begin() + 1, args.end());

  if (command == "version") {
    return CommandVersion(rest, context);
  }
  if (command == "list-devices") {
    return CommandListDevices(rest, context);
  }
  if (command == "snap") {
    return CommandSnap(rest, context);
  }
  if (command == "check-dir") {
    return CommandCheckDir(rest, context);
  }
  if (command == "serve") {
    return CommandServe(rest, context);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(*context.out);
    return kExitSuccess;
  }

  *context.err << "error: unknown subcommand: " << command << '\n';
  PrintUsage(*context.err);
  return kExitUsage;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);
  const DispatchContext context{
      .factory = backends::webcam::CreateWebcamDeviceFactory(),
      .in = &std::cin,
      .out = &std::cout,
      .err = &std::cerr,
  };
  return Dispatch(args, context);
}

} // namespace chronosnap::cli
