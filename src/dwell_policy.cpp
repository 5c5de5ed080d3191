#include "idasen_tray/dwell_policy.hpp"

#include <cmath>
#include <stdexcept>

namespace idasen_tray {

DwellPolicy DwellPolicy::fromMinutes(const std::vector<std::string> & names,
                                     const std::vector<double> & minutes)
{
  if (names.size() != minutes.size()) {
    throw std::invalid_argument("dwell_positions and dwell_minutes differ in length");
  }
  DwellPolicy policy;
  for (std::size_t i = 0; i < names.size(); ++i) {
    const double m = minutes[i];
    if (!std::isfinite(m)) {
      throw std::invalid_argument("Dwell time for position '" + names[i] + "' is not a number");
    }
    if (m < 0.0) {
      throw std::invalid_argument("Negative dwell time for position '" + names[i] + "'");
    }
    if (m > kMaxMinutes) {
      throw std::invalid_argument("Dwell time for position '" + names[i] + "' exceeds " +
                                  std::to_string(static_cast<int>(kMaxMinutes)) + " minutes");
    }
    const auto dwell = std::chrono::duration_cast<Duration>(
      std::chrono::duration<double, std::ratio<60>>(m));
    if (m > 0.0 && dwell <= Duration::zero()) {
      throw std::invalid_argument("Dwell time for position '" + names[i] +
                                  "' is shorter than one millisecond");
    }
    policy.set(names[i], dwell);
  }
  return policy;
}

void DwellPolicy::set(const std::string & position, Duration duration)
{
  if (position.empty()) {
    throw std::invalid_argument("Dwell policy entry without a position name");
  }
  if (duration < Duration::zero()) {
    throw std::invalid_argument("Negative dwell time for position '" + position + "'");
  }
  durations_[position] = duration;
}

std::optional<DwellPolicy::Duration> DwellPolicy::lookup(const std::string & position) const
{
  auto it = durations_.find(position);
  if (it == durations_.end() || it->second <= Duration::zero()) {
    return std::nullopt;
  }
  return it->second;
}

TogglePair::TogglePair(std::string first, std::string second)
: first_(std::move(first))
, second_(std::move(second))
{
  if (first_.empty() || second_.empty() || first_ == second_) {
    throw std::invalid_argument("Toggle positions must be two distinct names");
  }
}

TogglePair TogglePair::fromList(const std::vector<std::string> & names)
{
  if (names.size() != 2) {
    throw std::invalid_argument("Exactly two toggle positions are required, got " +
                                std::to_string(names.size()));
  }
  return TogglePair(names[0], names[1]);
}

std::optional<std::string> TogglePair::complementOf(const std::string & position) const
{
  if (position == first_) return second_;
  if (position == second_) return first_;
  return std::nullopt;
}

} // namespace idasen_tray
