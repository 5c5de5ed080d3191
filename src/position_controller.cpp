#include "idasen_tray/position_controller.hpp"

#include <chrono>
#include <stdexcept>

namespace idasen_tray {

namespace {

const char * source_name(ChangeSource source)
{
  return source == ChangeSource::kDwellTimeout ? "dwell timeout" : "request";
}

double to_minutes(DwellTimer::Duration d)
{
  return std::chrono::duration<double, std::ratio<60>>(d).count();
}

} // namespace

PositionController::PositionController(std::shared_ptr<ConfigSource> config,
                                       std::shared_ptr<DeskMover> mover,
                                       Options options,
                                       DwellTimerFactory timer_factory)
: config_(std::move(config))
, mover_(std::move(mover))
, options_(std::move(options))
, timer_factory_(std::move(timer_factory))
, logger_(rclcpp::get_logger("idasen_tray.position_controller"))
{
  if (!config_ || !mover_ || !timer_factory_) {
    throw std::invalid_argument("PositionController needs a config source, desk mover and timer factory");
  }
}

PositionController::~PositionController()
{
  // Stop the command thread first so a firing timer has nowhere to post to,
  // then join the timer thread.
  queue_.stop();
  if (active_timer_) {
    active_timer_->abort();
    active_timer_.reset();
  }
}

void PositionController::setChangeListener(ChangeListener listener)
{
  listener_ = std::move(listener);
}

std::future<ApplyResult> PositionController::requestPositionChange(const std::string & position)
{
  return queue_.submit([this, position]() {
    ApplyResult result = applyPosition(position, ChangeSource::kRequest);
    result.current_position = currentPosition();
    return result;
  });
}

void PositionController::flush()
{
  auto done = queue_.submit([]() {});
  done.wait();
}

ControllerSnapshot PositionController::snapshot() const
{
  std::lock_guard<std::mutex> lk(state_mutex_);
  return state_;
}

std::optional<std::string> PositionController::currentPosition() const
{
  std::lock_guard<std::mutex> lk(state_mutex_);
  return state_.current_position;
}

ApplyResult PositionController::applyPosition(const std::string & position, ChangeSource source)
{
  PositionMap positions;
  try {
    positions = config_->positions();
  } catch (const ConfigUnavailableError & e) {
    RCLCPP_ERROR(logger_, "Cannot validate position %s: %s", position.c_str(), e.what());
    return {ApplyStatus::kConfigUnavailable, e.what()};
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Reading positions for %s failed: %s", position.c_str(), e.what());
    return {ApplyStatus::kConfigUnavailable, std::string("Positions unreadable: ") + e.what()};
  }

  if (positions.find(position) == positions.end()) {
    RCLCPP_ERROR(logger_, "Position %s is not valid position name", position.c_str());
    return {ApplyStatus::kInvalidPosition, "Position '" + position + "' is not a valid position name"};
  }

  if (currentPosition() == position) {
    RCLCPP_DEBUG(logger_, "Already at %s, nothing to do", position.c_str());
    return {ApplyStatus::kUnchanged, "Already at '" + position + "'"};
  }

  RCLCPP_INFO(logger_, "Changing position to %s (%s)...", position.c_str(), source_name(source));
  {
    std::lock_guard<std::mutex> lk(state_mutex_);
    state_.current_position = position;
  }

  // A failed move must not hold up bookkeeping or the nag timer.
  try {
    mover_->move(position);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Desk move to %s failed: %s", position.c_str(), e.what());
  }

  restartDwellTimer(position);

  if (listener_) {
    const ControllerSnapshot snap = snapshot();
    try {
      listener_(position, source, snap);
    } catch (const std::exception & e) {
      RCLCPP_WARN(logger_, "Position change listener failed: %s", e.what());
    }
  }
  return {ApplyStatus::kApplied, "Moved to '" + position + "'"};
}

void PositionController::restartDwellTimer(const std::string & position)
{
  clearDwellTimer();
  if (!options_.nagging_enabled) {
    return;
  }
  const auto dwell = options_.dwell_policy.lookup(position);
  if (!dwell) {
    return;
  }

  RCLCPP_DEBUG(logger_, "Setting counter to %.2f minutes...", to_minutes(*dwell));
  const DwellTimer::Id id = next_timer_id_++;
  active_timer_ = timer_factory_(id, [this](DwellTimer::Id fired_id) {
    queue_.post([this, fired_id]() { onTimeout(fired_id); });
  });
  active_timer_->start(*dwell);

  std::lock_guard<std::mutex> lk(state_mutex_);
  state_.active_timer = id;
  state_.active_dwell = *dwell;
}

void PositionController::clearDwellTimer()
{
  if (active_timer_) {
    active_timer_->abort();
    active_timer_.reset();
  }
  std::lock_guard<std::mutex> lk(state_mutex_);
  state_.active_timer.reset();
  state_.active_dwell = DwellTimer::Duration::zero();
}

void PositionController::onTimeout(DwellTimer::Id id)
{
  // The abort flag alone is not enough: a timer may fire just before it is
  // superseded, so only the stored timer may toggle.
  if (!active_timer_ || active_timer_->id() != id) {
    RCLCPP_DEBUG(logger_, "Ignoring timeout of superseded timer %lu", static_cast<unsigned long>(id));
    return;
  }
  clearDwellTimer();

  const auto current = currentPosition();
  if (!current) {
    return;
  }
  const auto next = options_.toggle_pair.complementOf(*current);
  if (!next) {
    RCLCPP_WARN(logger_, "Position timeout at %s, which is not one of the toggle positions (%s, %s)",
                current->c_str(), options_.toggle_pair.first().c_str(),
                options_.toggle_pair.second().c_str());
    return;
  }

  RCLCPP_INFO(logger_, "Position timeout, toggling position...");
  const ApplyResult result = applyPosition(*next, ChangeSource::kDwellTimeout);
  if (!result.ok()) {
    RCLCPP_ERROR(logger_, "Toggle to %s failed: %s", next->c_str(), result.message.c_str());
  }
}

} // namespace idasen_tray
