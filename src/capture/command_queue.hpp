#pragma once

#include "capture/device_command.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace chronosnap::capture {

// Unbounded FIFO with many producers and one consumer.
//
// After `Close()`:
// - `Push` refuses new commands
// - `Pop` keeps returning queued commands until the queue is drained, then
//   returns false so the consumer loop can exit
class CommandQueue {
public:
  CommandQueue() = default;
  CommandQueue(const CommandQueue&) = delete;
  CommandQueue& operator=(const CommandQueue&) = delete;

  // Returns false (and leaves `command` untouched) when the queue is closed.
  bool Push(DeviceCommand&& command);

  // Blocks until a command is available or the queue is closed and empty.
  bool Pop(DeviceCommand& command);

  void Close();
  bool IsClosed() const;
  std::size_t Size() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<DeviceCommand> commands_;
  bool closed_ = false;
};

// Copyable sending endpoint shared by every caller thread.
class CommandSender {
public:
  CommandSender() = default;
  explicit CommandSender(std::shared_ptr<CommandQueue> queue);

  // Fails with COMMAND_CHANNEL_CLOSED when the worker can no longer receive.
  bool Send(DeviceCommand&& command, std::string& error) const;

  bool IsConnected() const;

private:
  std::shared_ptr<CommandQueue> queue_;
};

} // namespace chronosnap::capture
