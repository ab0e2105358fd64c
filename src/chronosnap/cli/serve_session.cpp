#include "chronosnap/cli/serve_session.hpp"

#include "capture/device_status.hpp"
#include "core/errors/device_error.hpp"
#include "core/json_utils.hpp"
#include "storage/file_store.hpp"

#include <charconv>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace chronosnap::cli {

namespace {

using core::errors::DeviceErrorCode;
using core::errors::FormatDeviceError;

std::vector<std::string> Tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream stream(line);
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

struct Reply {
  bool ok = false;
  std::string line;
};

Reply OkReply(std::string_view result_json) {
  return Reply{.ok = true, .line = "{\"ok\":true,\"result\":" + std::string(result_json) + "}"};
}

Reply ErrorReply(std::string_view error) {
  return Reply{.ok = false, .line = "{\"ok\":false,\"error\":" + core::QuoteJson(error) + "}"};
}

Reply UsageError(std::string_view message) {
  return ErrorReply(FormatDeviceError(DeviceErrorCode::kInvalidRequest, message));
}

std::string DevicesToJson(const std::vector<backends::CaptureDeviceInfo>& devices) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < devices.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << "{\"id\":" << core::QuoteJson(devices[i].id)
        << ",\"name\":" << core::QuoteJson(devices[i].name) << '}';
  }
  out << ']';
  return out.str();
}

Reply HandleRequest(const std::vector<std::string>& tokens,
                    capture::DeviceController& controller) {
  const std::string& verb = tokens.front();
  const std::size_t argc = tokens.size() - 1U;
  std::string error;

  if (verb == "list_devices") {
    if (argc != 0U) {
      return UsageError("list_devices does not accept arguments");
    }
    std::vector<backends::CaptureDeviceInfo> devices;
    if (!controller.ListDevices(devices, error)) {
      return ErrorReply(error);
    }
    return OkReply(DevicesToJson(devices));
  }

  if (verb == "start") {
    if (argc > 1U) {
      return UsageError("start accepts at most 1 argument: [device_id]");
    }
    std::optional<std::string> device_id;
    if (argc == 1U) {
      device_id = tokens[1];
    }
    capture::DeviceStatus status;
    if (!controller.Start(device_id, status, error)) {
      return ErrorReply(error);
    }
    return OkReply(capture::ToJson(status));
  }

  if (verb == "stop") {
    if (argc != 0U) {
      return UsageError("stop does not accept arguments");
    }
    if (!controller.Stop(error)) {
      return ErrorReply(error);
    }
    return OkReply("null");
  }

  if (verb == "status") {
    if (argc != 0U) {
      return UsageError("status does not accept arguments");
    }
    capture::DeviceStatus status;
    if (!controller.Status(status, error)) {
      return ErrorReply(error);
    }
    return OkReply(capture::ToJson(status));
  }

  if (verb == "capture") {
    if (argc > 1U) {
      return UsageError("capture accepts at most 1 argument: [quality]");
    }
    std::optional<int> quality;
    if (argc == 1U) {
      int parsed = 0;
      if (!ParseQualityArgument(tokens[1], parsed)) {
        return UsageError("capture quality must be an integer, got '" + tokens[1] + "'");
      }
      quality = parsed;
    }
    std::string data_uri;
    if (!controller.Capture(quality, data_uri, error)) {
      return ErrorReply(error);
    }
    return OkReply(core::QuoteJson(data_uri));
  }

  if (verb == "preview") {
    if (argc != 0U) {
      return UsageError("preview does not accept arguments");
    }
    std::string data_uri;
    if (!controller.Preview(data_uri, error)) {
      return ErrorReply(error);
    }
    return OkReply(core::QuoteJson(data_uri));
  }

  if (verb == "save_file") {
    if (argc != 3U) {
      return UsageError("save_file requires 3 arguments: <dir> <name> <base64>");
    }
    std::filesystem::path written;
    if (!storage::SaveFileToDisk(tokens[1], tokens[2], tokens[3], written, error)) {
      return ErrorReply(error);
    }
    return OkReply(core::QuoteJson(written.string()));
  }

  if (verb == "check_dir") {
    if (argc != 1U) {
      return UsageError("check_dir requires 1 argument: <dir>");
    }
    bool writable = false;
    if (!storage::CheckDirectoryWritable(tokens[1], writable, error)) {
      return ErrorReply(error);
    }
    return OkReply(writable ? "true" : "false");
  }

  return UsageError("unknown command '" + verb + "'");
}

} // namespace

bool ParseQualityArgument(std::string_view raw, int& quality) {
  if (raw.empty()) {
    return false;
  }
  int parsed = 0;
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }
  quality = parsed;
  return true;
}

ServeSessionStats RunServeSession(std::istream& in, std::ostream& out,
                                  capture::DeviceController& controller,
                                  core::logging::Logger& logger) {
  ServeSessionStats stats;
  logger.Info("serve session started");

  std::string line;
  while (std::getline(in, line)) {
    const std::vector<std::string> tokens = Tokenize(line);
    if (tokens.empty()) {
      continue;
    }
    ++stats.requests;
    logger.Debug("serve request", {{"command", tokens.front()}});

    if (tokens.front() == "quit") {
      out << OkReply("null").line << '\n';
      out.flush();
      break;
    }

    const Reply reply = HandleRequest(tokens, controller);
    if (!reply.ok) {
      ++stats.failures;
    }
    out << reply.line << '\n';
    out.flush();
  }

  logger.Info("serve session ended", {{"requests", std::to_string(stats.requests)},
                                      {"failures", std::to_string(stats.failures)}});
  return stats;
}

} // namespace chronosnap::cli
