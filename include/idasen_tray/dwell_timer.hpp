#pragma once

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace idasen_tray {

// One-shot countdown. Fires its callback at most once, never after abort().
// Each dwell period uses a fresh instance.
class DwellTimer {
public:
  using Duration = std::chrono::milliseconds;
  using Id = std::uint64_t;
  using TimeoutCallback = std::function<void(Id)>;

  virtual ~DwellTimer() = default;

  // Throws std::invalid_argument for duration <= 0 and std::logic_error if
  // the timer was already started.
  virtual void start(Duration duration) = 0;
  // Idempotent; a no-op once the timer has fired.
  virtual void abort() = 0;

  virtual bool fired() const = 0;
  virtual bool aborted() const = 0;
  virtual Id id() const = 0;
};

using DwellTimerFactory =
  std::function<std::unique_ptr<DwellTimer>(DwellTimer::Id, DwellTimer::TimeoutCallback)>;

// Sleeps on a background thread. fired/aborted are decided under one lock, so a
// racing abort either suppresses the callback or becomes a no-op.
class ThreadDwellTimer : public DwellTimer {
public:
  ThreadDwellTimer(Id id, TimeoutCallback on_timeout);
  ~ThreadDwellTimer() override;

  ThreadDwellTimer(const ThreadDwellTimer &) = delete;
  ThreadDwellTimer & operator=(const ThreadDwellTimer &) = delete;

  void start(Duration duration) override;
  void abort() override;

  bool fired() const override;
  bool aborted() const override;
  Id id() const override { return id_; }

private:
  void run(Duration duration);

  const Id id_;
  TimeoutCallback on_timeout_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool started_{false};
  bool fired_{false};
  bool aborted_{false};
  std::thread worker_;
  rclcpp::Logger logger_;
};

DwellTimerFactory makeThreadDwellTimerFactory();

} // namespace idasen_tray
