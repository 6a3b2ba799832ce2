#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mdview::common {

constexpr int kDefaultPreviewDelayMs = 1000;

/// Settings read from the optional user config file. Unset keys stay
/// std::nullopt so the command line can tell "not configured" from "false".
struct Config {
    std::optional<bool> style;
    std::optional<int> previewDelayMs;
    std::optional<std::string> viewerCommand;
    std::optional<std::filesystem::path> stylesheet;
    std::optional<bool> unsafeHtml;
    std::optional<std::filesystem::path> logFile;
};

/// Parses config JSON text. `origin` only appears in error messages.
std::expected<Config, std::string> parseConfig(std::string_view text, std::string_view origin);

/// Loads the config file at `path`. A missing file yields a default Config.
std::expected<Config, std::string> loadConfigFile(const std::filesystem::path& path);

/// Loads the config from `overridePath` when given, otherwise from the user
/// config location (see userConfigPath()).
std::expected<Config, std::string> loadConfig(const std::optional<std::filesystem::path>& overridePath);

}  // namespace mdview::common
