#include "capture/actor_registry.hpp"

#include "core/errors/device_error.hpp"

#include <system_error>
#include <utility>

namespace chronosnap::capture {

ActorRegistry::ActorRegistry(std::shared_ptr<backends::ICaptureDeviceFactory> factory,
                             core::logging::Logger& logger,
                             ActorOptions options)
    : factory_(std::move(factory)), logger_(logger), options_(options) {}

ActorRegistry::~ActorRegistry() {
  Shutdown();
}

bool ActorRegistry::EnsureStarted(CommandSender& sender, std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mu_);
  ++ensure_calls_;

  if (shut_down_) {
    error = core::errors::FormatDeviceError(core::errors::DeviceErrorCode::kCommandChannelClosed,
                                            "device worker has been shut down");
    return false;
  }
  if (queue_ != nullptr) {
    sender = CommandSender(queue_);
    return true;
  }
  if (factory_ == nullptr) {
    error = core::errors::FormatDeviceError(core::errors::DeviceErrorCode::kUnknown,
                                            "no capture backend configured");
    return false;
  }

  auto queue = std::make_shared<CommandQueue>();
  auto actor = std::make_unique<DeviceActor>(factory_, logger_, options_);
  try {
    worker_ = std::thread([queue, raw_actor = actor.get()] { raw_actor->Run(*queue); });
  } catch (const std::system_error& ex) {
    error = core::errors::FormatDeviceError(core::errors::DeviceErrorCode::kUnknown,
                                            std::string("failed to spawn device worker: ") +
                                                ex.what());
    logger_.Error("device worker spawn failed", {{"error", ex.what()}});
    return false;
  }

  queue_ = std::move(queue);
  actor_ = std::move(actor);
  ++workers_spawned_;
  sender = CommandSender(queue_);
  return true;
}

void ActorRegistry::Shutdown() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    if (queue_ != nullptr) {
      queue_->Close();
    }
    worker = std::move(worker_);
  }

  if (worker.joinable()) {
    worker.join();
  }

  std::lock_guard<std::mutex> lock(mu_);
  actor_.reset();
}

ActorRegistry::Snapshot ActorRegistry::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .started = queue_ != nullptr,
      .shut_down = shut_down_,
      .workers_spawned = workers_spawned_,
      .ensure_calls = ensure_calls_,
  };
}

} // namespace chronosnap::capture
