#pragma once

#include <rclcpp/rclcpp.hpp>

#include <string>

namespace idasen_tray {

class DeskMover {
public:
  virtual ~DeskMover() = default;
  // Fire-and-forget. Implementations log their own failures.
  virtual void move(const std::string & position) = 0;
};

// Runs `<command> <position>` as a detached child process.
class CliDeskMover : public DeskMover {
public:
  explicit CliDeskMover(std::string command = "idasen");

  void move(const std::string & position) override;

private:
  std::string command_;
  rclcpp::Logger logger_;
};

} // namespace idasen_tray
