#include "idasen_tray/command_queue.hpp"

#include <exception>

#include <rclcpp/rclcpp.hpp>

namespace idasen_tray {

CommandQueue::CommandQueue()
: worker_(&CommandQueue::run, this)
{
}

CommandQueue::~CommandQueue()
{
  stop();
}

bool CommandQueue::post(Command command)
{
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (stopping_) {
      return false;
    }
    pending_.push_back(std::move(command));
  }
  cv_.notify_one();
  return true;
}

void CommandQueue::stop()
{
  std::deque<Command> dropped;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    stopping_ = true;
    dropped.swap(pending_);
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

void CommandQueue::run()
{
  while (true) {
    Command command;
    {
      std::unique_lock<std::mutex> lk(mutex_);
      cv_.wait(lk, [this]() { return stopping_ || !pending_.empty(); });
      if (stopping_) {
        return;
      }
      command = std::move(pending_.front());
      pending_.pop_front();
    }
    try {
      command();
    } catch (const std::exception & e) {
      RCLCPP_ERROR(rclcpp::get_logger("idasen_tray.command_queue"),
                   "Command failed: %s", e.what());
    }
  }
}

} // namespace idasen_tray
