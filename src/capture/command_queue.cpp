#include "capture/command_queue.hpp"

#include "core/errors/device_error.hpp"

#include <utility>

namespace chronosnap::capture {

bool CommandQueue::Push(DeviceCommand&& command) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      return false;
    }
    commands_.push_back(std::move(command));
  }
  cv_.notify_one();
  return true;
}

bool CommandQueue::Pop(DeviceCommand& command) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return closed_ || !commands_.empty(); });
  if (commands_.empty()) {
    return false;
  }
  command = std::move(commands_.front());
  commands_.pop_front();
  return true;
}

void CommandQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool CommandQueue::IsClosed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::size_t CommandQueue::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return commands_.size();
}

CommandSender::CommandSender(std::shared_ptr<CommandQueue> queue) : queue_(std::move(queue)) {}

bool CommandSender::Send(DeviceCommand&& command, std::string& error) const {
  error.clear();
  if (queue_ == nullptr) {
    error = core::errors::FormatDeviceError(core::errors::DeviceErrorCode::kCommandChannelClosed,
                                            "no device worker is attached to this sender");
    return false;
  }
  if (!queue_->Push(std::move(command))) {
    error = core::errors::FormatDeviceError(core::errors::DeviceErrorCode::kCommandChannelClosed,
                                            "device worker is no longer accepting commands");
    return false;
  }
  return true;
}

bool CommandSender::IsConnected() const {
  return queue_ != nullptr && !queue_->IsClosed();
}

} // namespace chronosnap::capture
