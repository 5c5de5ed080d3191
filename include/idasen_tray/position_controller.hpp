#pragma once

#include <rclcpp/rclcpp.hpp>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "idasen_tray/command_queue.hpp"
#include "idasen_tray/config_source.hpp"
#include "idasen_tray/desk_mover.hpp"
#include "idasen_tray/dwell_policy.hpp"
#include "idasen_tray/dwell_timer.hpp"
#include "idasen_tray/position_types.hpp"

namespace idasen_tray {

enum class ChangeSource {
  kRequest,
  kDwellTimeout
};

// Read-only view of the controller, safe to take from any thread.
struct ControllerSnapshot {
  std::optional<std::string> current_position;
  std::optional<DwellTimer::Id> active_timer;
  DwellTimer::Duration active_dwell{0};
};

// Position state machine. Every mutation, whether a user request or a dwell
// timeout, runs on one command queue in arrival order.
class PositionController {
public:
  // Called on the command thread after each accepted change.
  using ChangeListener =
    std::function<void(const std::string & position, ChangeSource source, const ControllerSnapshot &)>;

  struct Options {
    bool nagging_enabled{true};
    DwellPolicy dwell_policy;
    TogglePair toggle_pair{"sit", "stand"};
  };

  PositionController(std::shared_ptr<ConfigSource> config,
                     std::shared_ptr<DeskMover> mover,
                     Options options,
                     DwellTimerFactory timer_factory = makeThreadDwellTimerFactory());
  ~PositionController();

  PositionController(const PositionController &) = delete;
  PositionController & operator=(const PositionController &) = delete;

  std::future<ApplyResult> requestPositionChange(const std::string & position);

  // Blocks until every command posted before this call has been processed.
  void flush();

  ControllerSnapshot snapshot() const;
  std::optional<std::string> currentPosition() const;
  bool naggingEnabled() const { return options_.nagging_enabled; }

  // Set before issuing commands.
  void setChangeListener(ChangeListener listener);

private:
  ApplyResult applyPosition(const std::string & position, ChangeSource source);
  void restartDwellTimer(const std::string & position);
  void clearDwellTimer();
  void onTimeout(DwellTimer::Id id);

  std::shared_ptr<ConfigSource> config_;
  std::shared_ptr<DeskMover> mover_;
  const Options options_;
  DwellTimerFactory timer_factory_;
  ChangeListener listener_;
  rclcpp::Logger logger_;

  // Owned by the command thread.
  std::unique_ptr<DwellTimer> active_timer_;
  DwellTimer::Id next_timer_id_{1};

  // Mirror of the command thread's state for snapshot().
  mutable std::mutex state_mutex_;
  ControllerSnapshot state_;

  // Declared last: its worker must not outlive the members above.
  CommandQueue queue_;
};

} // namespace idasen_tray
