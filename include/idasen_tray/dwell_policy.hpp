#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace idasen_tray {

// How long each position may be held before the nag timer toggles the desk.
class DwellPolicy {
public:
  using Duration = std::chrono::milliseconds;

  // Longest dwell accepted: one day.
  static constexpr double kMaxMinutes = 24.0 * 60.0;

  DwellPolicy() = default;

  // Parallel arrays as they come from ROS parameters. Throws std::invalid_argument
  // on length mismatch, empty names, or minutes that are not finite, negative,
  // above kMaxMinutes or too small to round to one millisecond.
  static DwellPolicy fromMinutes(const std::vector<std::string> & names,
                                 const std::vector<double> & minutes);

  // A zero duration is stored and means "no nagging" for the position.
  void set(const std::string & position, Duration duration);

  // Positive duration for the position, nullopt when nagging does not apply.
  std::optional<Duration> lookup(const std::string & position) const;

  bool empty() const { return durations_.empty(); }

private:
  std::map<std::string, Duration> durations_;
};

// The two positions the dwell timeout toggles between.
class TogglePair {
public:
  // Throws std::invalid_argument unless both names are non-empty and distinct.
  TogglePair(std::string first, std::string second);

  static TogglePair fromList(const std::vector<std::string> & names);

  std::optional<std::string> complementOf(const std::string & position) const;

  const std::string & first() const { return first_; }
  const std::string & second() const { return second_; }

private:
  std::string first_;
  std::string second_;
};

} // namespace idasen_tray
