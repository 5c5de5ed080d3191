#include "idasen_tray/config_source.hpp"

#include <yaml-cpp/yaml.h>

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>

namespace idasen_tray {

std::string expand_user_path(const std::string & path)
{
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    // ~otheruser is not supported
    return path;
  }
  std::string home;
  if (const char * env = std::getenv("HOME"); env && *env) {
    home = env;
  } else if (const passwd * pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
    home = pw->pw_dir;
  } else {
    return path;
  }
  return home + path.substr(1);
}

YamlConfigSource::YamlConfigSource(std::string path)
: path_(std::move(path))
{
}

PositionMap YamlConfigSource::positions()
{
  const std::string file = expand_user_path(path_);
  if (!std::ifstream(file).good()) {
    throw ConfigUnavailableError("Cannot open idasen config " + file);
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(file);
  } catch (const YAML::Exception & e) {
    throw ConfigUnavailableError("Failed to parse " + file + ": " + e.what());
  }

  // operator[] throws on a scalar or sequence root.
  if (!root.IsMap() || !root["positions"] || !root["positions"].IsMap()) {
    throw ConfigUnavailableError("YAML has no 'positions' map: " + file);
  }
  const YAML::Node node = root["positions"];

  PositionMap out;
  try {
    for (auto it : node) {
      out[it.first.as<std::string>()] = it.second.as<double>();
    }
  } catch (const YAML::Exception & e) {
    throw ConfigUnavailableError("Invalid position entry in " + file + ": " + e.what());
  }
  return out;
}

} // namespace idasen_tray
