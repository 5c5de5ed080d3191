#include "idasen_tray/desk_mover.hpp"

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

extern char ** environ;

namespace idasen_tray {

CliDeskMover::CliDeskMover(std::string command)
: command_(std::move(command))
, logger_(rclcpp::get_logger("idasen_tray.desk_mover"))
{
}

void CliDeskMover::move(const std::string & position)
{
  std::vector<char *> argv;
  argv.push_back(const_cast<char *>(command_.c_str()));
  argv.push_back(const_cast<char *>(position.c_str()));
  argv.push_back(nullptr);

  pid_t pid = -1;
  const int rc = ::posix_spawnp(&pid, command_.c_str(), nullptr, nullptr, argv.data(), environ);
  if (rc != 0) {
    RCLCPP_ERROR(logger_, "Failed to run '%s %s': %s",
                 command_.c_str(), position.c_str(), std::strerror(rc));
    return;
  }
  RCLCPP_DEBUG(logger_, "Spawned '%s %s' (pid %d)", command_.c_str(), position.c_str(), pid);

  // Reap the child off the caller's thread so a slow desk never blocks a command.
  std::thread{[pid, position, command = command_, logger = logger_]() {
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
      RCLCPP_WARN(logger, "waitpid(%d) failed: %s", pid, std::strerror(errno));
      return;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
      RCLCPP_WARN(logger, "'%s %s' exited with status %d",
                  command.c_str(), position.c_str(), WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
      RCLCPP_WARN(logger, "'%s %s' killed by signal %d",
                  command.c_str(), position.c_str(), WTERMSIG(status));
    }
  }}.detach();
}

} // namespace idasen_tray
