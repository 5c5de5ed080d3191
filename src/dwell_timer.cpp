#include "idasen_tray/dwell_timer.hpp"

#include <stdexcept>

namespace idasen_tray {

ThreadDwellTimer::ThreadDwellTimer(Id id, TimeoutCallback on_timeout)
: id_(id)
, on_timeout_(std::move(on_timeout))
, logger_(rclcpp::get_logger("idasen_tray.dwell_timer"))
{
}

ThreadDwellTimer::~ThreadDwellTimer()
{
  abort();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void ThreadDwellTimer::start(Duration duration)
{
  if (duration <= Duration::zero()) {
    throw std::invalid_argument("Dwell timer duration must be positive");
  }
  std::lock_guard<std::mutex> lk(mutex_);
  if (started_) {
    throw std::logic_error("Dwell timer already started");
  }
  started_ = true;
  worker_ = std::thread(&ThreadDwellTimer::run, this, duration);
}

void ThreadDwellTimer::abort()
{
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (fired_ || aborted_) {
      return;
    }
    aborted_ = true;
  }
  RCLCPP_DEBUG(logger_, "Counting aborted... (timer %lu)", static_cast<unsigned long>(id_));
  cv_.notify_all();
}

bool ThreadDwellTimer::fired() const
{
  std::lock_guard<std::mutex> lk(mutex_);
  return fired_;
}

bool ThreadDwellTimer::aborted() const
{
  std::lock_guard<std::mutex> lk(mutex_);
  return aborted_;
}

void ThreadDwellTimer::run(Duration duration)
{
  RCLCPP_DEBUG(logger_, "Timer %lu started!", static_cast<unsigned long>(id_));
  {
    std::unique_lock<std::mutex> lk(mutex_);
    if (cv_.wait_for(lk, duration, [this]() { return aborted_; })) {
      return;
    }
    fired_ = true;
  }
  RCLCPP_DEBUG(logger_, "Timeout! (timer %lu)", static_cast<unsigned long>(id_));
  if (on_timeout_) {
    on_timeout_(id_);
  }
}

DwellTimerFactory makeThreadDwellTimerFactory()
{
  return [](DwellTimer::Id id, DwellTimer::TimeoutCallback on_timeout) {
    return std::make_unique<ThreadDwellTimer>(id, std::move(on_timeout));
  };
}

} // namespace idasen_tray
