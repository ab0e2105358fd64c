#pragma once

#include "backends/capture_device.hpp"
#include "capture/command_queue.hpp"
#include "capture/device_actor.hpp"
#include "core/logging/logger.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chronosnap::capture {

// Application-lifetime owner of the single device worker.
//
// Why this exists:
// - the capture device is exclusive, so exactly one worker may ever own it
// - callers arrive from many threads and any of them may be first
// - the application shell constructs one registry and injects it, so tests can
//   run several isolated registries in one process
//
// The worker is spawned lazily by the first `EnsureStarted` and never
// replaced. `Shutdown` (also run by the destructor) closes the queue, lets the
// worker drain it, and joins.
class ActorRegistry {
public:
  ActorRegistry(std::shared_ptr<backends::ICaptureDeviceFactory> factory,
                core::logging::Logger& logger,
                ActorOptions options = {});
  ~ActorRegistry();

  ActorRegistry(const ActorRegistry&) = delete;
  ActorRegistry& operator=(const ActorRegistry&) = delete;

  // Yields the worker's endpoint, spawning the worker on first use.
  bool EnsureStarted(CommandSender& sender, std::string& error);

  // Safe to call repeatedly and from any thread other than the worker.
  void Shutdown();

  // Snapshot is used by smoke tests to verify single-spawn and teardown.
  struct Snapshot {
    bool started = false;
    bool shut_down = false;
    std::uint64_t workers_spawned = 0;
    std::uint64_t ensure_calls = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  std::shared_ptr<backends::ICaptureDeviceFactory> factory_;
  core::logging::Logger& logger_;
  ActorOptions options_;

  mutable std::mutex mu_;
  std::shared_ptr<CommandQueue> queue_;
  std::unique_ptr<DeviceActor> actor_;
  std::thread worker_;
  bool shut_down_ = false;
  std::uint64_t workers_spawned_ = 0;
  std::uint64_t ensure_calls_ = 0;
};

} // namespace chronosnap::capture
