#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace idasen_tray {

// Position name -> desk height in metres, as read from the positions file.
using PositionMap = std::map<std::string, double>;

// Codes are part of the RequestPosition service contract.
enum class ApplyStatus : std::uint8_t {
  kApplied = 0,
  kUnchanged = 1,
  kInvalidPosition = 2,
  kConfigUnavailable = 3
};

const char * to_string(ApplyStatus status);

struct ApplyResult {
  ApplyStatus status{ApplyStatus::kApplied};
  std::string message;
  // Position right after this command, before any later command ran.
  std::optional<std::string> current_position;

  bool ok() const
  {
    return status == ApplyStatus::kApplied || status == ApplyStatus::kUnchanged;
  }
};

class ConfigUnavailableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace idasen_tray
