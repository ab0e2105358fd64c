#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "backends/webcam/testing/fake_capture_device.hpp"
#include "capture/actor_registry.hpp"
#include "capture/device_controller.hpp"
#include "chronosnap/cli/serve_session.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using chronosnap::backends::webcam::testing::FakeCaptureDeviceFactory;
using chronosnap::backends::webcam::testing::FakeDeviceSpec;
using chronosnap::capture::ActorRegistry;
using chronosnap::capture::DeviceController;
using chronosnap::cli::ParseQualityArgument;
using chronosnap::cli::RunServeSession;
using chronosnap::cli::ServeSessionStats;
using chronosnap::core::logging::LogLevel;
using chronosnap::core::logging::Logger;
using chronosnap::tests::common::AssertContains;
using chronosnap::tests::common::AssertNotContains;
using chronosnap::tests::common::CreateUniqueTempDir;
using chronosnap::tests::common::DispatchArgs;
using chronosnap::tests::common::Fail;
using chronosnap::tests::common::ReadFileToString;
using chronosnap::tests::common::RemovePathBestEffort;

std::shared_ptr<FakeCaptureDeviceFactory> MakeFactory() {
  return std::make_shared<FakeCaptureDeviceFactory>(std::vector<FakeDeviceSpec>{
      FakeDeviceSpec{.name = "Booth \"A\" Camera"},
  });
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

void AssertSessionTranscript(const std::filesystem::path& root) {
  auto factory = MakeFactory();
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);
  ActorRegistry registry(factory, logger);
  DeviceController controller(registry, factory, logger);

  const std::filesystem::path out_dir = root / "saved";
  std::istringstream in("list_devices\n"
                        "capture\n"
                        "\n"
                        "start\n"
                        "status\n"
                        "capture 75\n"
                        "preview\n"
                        "capture high\n"
                        "stop\n"
                        "status\n"
                        "save_file " + out_dir.string() + " note.txt aGVsbG8=\n"
                        "check_dir " + out_dir.string() + "\n"
                        "launch\n"
                        "quit\n"
                        "status\n");
  std::ostringstream out;
  const ServeSessionStats stats = RunServeSession(in, out, controller, logger);

  const std::vector<std::string> lines = SplitLines(out.str());
  if (lines.size() != 13U) {
    Fail("expected one reply per non-blank request up to quit, got " +
         std::to_string(lines.size()));
  }
  if (lines[0] != "{\"ok\":true,\"result\":[{\"id\":\"0\",\"name\":\"Booth \\\"A\\\" Camera\"}]}") {
    Fail("unexpected list_devices reply: " + lines[0]);
  }
  if (lines[1] != "{\"ok\":false,\"error\":\"DEVICE_NOT_STARTED: Device not started\"}") {
    Fail("unexpected capture-before-start reply: " + lines[1]);
  }
  AssertContains(lines[2], "\"is_active\":true");
  AssertContains(lines[2], "\"resolution\":[640,480]");
  AssertContains(lines[3], "\"device_name\":\"Booth \\\"A\\\" Camera\"");
  AssertContains(lines[4], "{\"ok\":true,\"result\":\"data:image/jpeg;base64,");
  AssertContains(lines[5], "{\"ok\":true,\"result\":\"data:image/jpeg;base64,");
  AssertContains(lines[6], "INVALID_REQUEST");
  if (lines[7] != "{\"ok\":true,\"result\":null}") {
    Fail("unexpected stop reply: " + lines[7]);
  }
  if (lines[8] !=
      "{\"ok\":true,\"result\":{\"is_active\":false,\"device_name\":null,\"resolution\":null}}") {
    Fail("unexpected inactive status reply: " + lines[8]);
  }
  AssertContains(lines[9], "note.txt");
  if (ReadFileToString(out_dir / "note.txt") != "hello") {
    Fail("save_file should write the decoded payload");
  }
  if (lines[10] != "{\"ok\":true,\"result\":true}") {
    Fail("unexpected check_dir reply: " + lines[10]);
  }
  AssertContains(lines[11], "INVALID_REQUEST: unknown command 'launch'");
  if (lines[12] != "{\"ok\":true,\"result\":null}") {
    Fail("quit should acknowledge before exiting");
  }

  // quit is counted; the trailing status is never read.
  if (stats.requests != 13U || stats.failures != 3U) {
    Fail("unexpected session stats");
  }
  AssertContains(log_sink.str(), "msg=\"serve session ended\"");
  AssertContains(log_sink.str(), "requests=\"13\"");
}

void AssertArgumentValidation() {
  auto factory = MakeFactory();
  std::ostringstream log_sink;
  Logger logger(LogLevel::kInfo, log_sink);
  ActorRegistry registry(factory, logger);
  DeviceController controller(registry, factory, logger);

  std::istringstream in("start 0 1\nstop now\nsave_file onlydir\ncheck_dir\nlist_devices x\n");
  std::ostringstream out;
  const ServeSessionStats stats = RunServeSession(in, out, controller, logger);
  if (stats.requests != 5U || stats.failures != 5U) {
    Fail("every malformed request should fail");
  }
  for (const std::string& line : SplitLines(out.str())) {
    AssertContains(line, "\"ok\":false");
    AssertContains(line, "INVALID_REQUEST");
  }
  if (factory->probe()->devices_created.load() != 0U) {
    Fail("malformed start must not reach the device");
  }
}

void AssertQualityParsing() {
  int quality = 0;
  if (!ParseQualityArgument("90", quality) || quality != 90) {
    Fail("90 should parse");
  }
  if (!ParseQualityArgument("-5", quality) || quality != -5) {
    Fail("out-of-range values are passed through to the encoder");
  }
  if (ParseQualityArgument("", quality) || ParseQualityArgument("9x", quality) ||
      ParseQualityArgument("high", quality)) {
    Fail("non-integers must be rejected");
  }
}

void AssertServeSubcommand() {
  const auto result = DispatchArgs({"serve", "--query-timeout-ms", "4000", "--log-level", "warn"},
                                   MakeFactory(), "start\ncapture\nstop\n");
  if (result.exit_code != 0) {
    Fail("serve should exit 0 at end of input: " + result.stderr_text);
  }
  const std::vector<std::string> lines = SplitLines(result.stdout_text);
  if (lines.size() != 3U) {
    Fail("serve should answer every request");
  }
  for (const std::string& line : lines) {
    AssertContains(line, "\"ok\":true");
  }
  AssertNotContains(result.stderr_text, "serve session started");

  const auto bad_timeout = DispatchArgs({"serve", "--start-timeout-ms", "0"}, MakeFactory());
  if (bad_timeout.exit_code != 2) {
    Fail("non-positive timeout should be a usage error");
  }
  AssertContains(bad_timeout.stderr_text, "--start-timeout-ms must be a positive integer");
}

} // namespace

int main() {
  const std::filesystem::path root = CreateUniqueTempDir("chronosnap-serve");
  AssertSessionTranscript(root);
  AssertArgumentValidation();
  AssertQualityParsing();
  AssertServeSubcommand();
  RemovePathBestEffort(root);

  std::cout << "serve_session_smoke: ok\n";
  return 0;
}
