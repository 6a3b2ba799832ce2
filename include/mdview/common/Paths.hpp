#pragma once

#include <filesystem>

namespace mdview::common {

/// Returns the mdview user config directory.
/// $XDG_CONFIG_HOME/mdview/ or ~/.config/mdview/.
/// Returns an empty path when no user config location is available.
std::filesystem::path userConfigDir();

/// Resolves the full path to the optional user config file (config.json in
/// userConfigDir()). Returns an empty path when userConfigDir() is empty.
std::filesystem::path userConfigPath();

/// Returns true if the file exists at the given path.
bool fileExists(const std::filesystem::path& path);

}  // namespace mdview::common
