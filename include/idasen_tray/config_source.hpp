#pragma once

#include <string>

#include "idasen_tray/position_types.hpp"

namespace idasen_tray {

class ConfigSource {
public:
  virtual ~ConfigSource() = default;
  // Throws ConfigUnavailableError when the position set cannot be read.
  virtual PositionMap positions() = 0;
};

// Reads the `positions` map of an idasen YAML file on every call.
class YamlConfigSource : public ConfigSource {
public:
  explicit YamlConfigSource(std::string path);

  PositionMap positions() override;

  const std::string & path() const { return path_; }

private:
  std::string path_;
};

// Expands a leading "~" to the user's home directory.
std::string expand_user_path(const std::string & path);

} // namespace idasen_tray
