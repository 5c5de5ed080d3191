#include "idasen_tray/position_types.hpp"

namespace idasen_tray {

const char * to_string(ApplyStatus status)
{
  switch (status) {
    case ApplyStatus::kApplied: return "applied";
    case ApplyStatus::kUnchanged: return "unchanged";
    case ApplyStatus::kInvalidPosition: return "invalid_position";
    case ApplyStatus::kConfigUnavailable: return "config_unavailable";
  }
  return "?";
}

} // namespace idasen_tray
