#include "mdview/common/Config.hpp"

#include "mdview/common/FileIo.hpp"
#include "mdview/common/Paths.hpp"

#include <format>

#include <nlohmann/json.hpp>

namespace mdview::common {
namespace {

using json = nlohmann::json;

std::expected<std::optional<bool>, std::string> readBool(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return std::optional<bool>{};
    }
    if (!it->is_boolean()) {
        return std::unexpected(std::format("'{}' must be a boolean", key));
    }
    return std::optional<bool>{it->get<bool>()};
}

std::expected<std::optional<std::string>, std::string> readString(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::unexpected(std::format("'{}' must not be empty", key));
    }
    return std::optional<std::string>{std::move(value)};
}

std::expected<std::optional<int>, std::string> readDelay(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return std::optional<int>{};
    }
    if (!it->is_number_integer()) {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    const auto value = it->get<long long>();
    if (value < 0 || value > 60000) {
        return std::unexpected(std::format("'{}' must be in range 0-60000 (got {})", key, value));
    }
    return std::optional<int>{static_cast<int>(value)};
}

}  // namespace

std::expected<Config, std::string> parseConfig(std::string_view text, std::string_view origin) {
    json root;
    try {
        root = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return std::unexpected(std::format("{}: invalid JSON: {}", origin, e.what()));
    }
    if (!root.is_object()) {
        return std::unexpected(std::format("{}: top-level value must be an object", origin));
    }

    auto fail = [&](const std::string& detail) -> std::expected<Config, std::string> {
        return std::unexpected(std::format("{}: {}", origin, detail));
    };

    Config config;

    auto style = readBool(root, "style");
    if (!style.has_value()) {
        return fail(style.error());
    }
    config.style = *style;

    auto delay = readDelay(root, "previewDelayMs");
    if (!delay.has_value()) {
        return fail(delay.error());
    }
    config.previewDelayMs = *delay;

    auto viewer = readString(root, "viewerCommand");
    if (!viewer.has_value()) {
        return fail(viewer.error());
    }
    config.viewerCommand = std::move(*viewer);

    auto stylesheet = readString(root, "stylesheet");
    if (!stylesheet.has_value()) {
        return fail(stylesheet.error());
    }
    if (stylesheet->has_value()) {
        config.stylesheet = std::filesystem::path(**stylesheet);
    }

    auto unsafeHtml = readBool(root, "unsafeHtml");
    if (!unsafeHtml.has_value()) {
        return fail(unsafeHtml.error());
    }
    config.unsafeHtml = *unsafeHtml;

    auto logFile = readString(root, "logFile");
    if (!logFile.has_value()) {
        return fail(logFile.error());
    }
    if (logFile->has_value()) {
        config.logFile = std::filesystem::path(**logFile);
    }

    return config;
}

std::expected<Config, std::string> loadConfigFile(const std::filesystem::path& path) {
    if (!fileExists(path)) {
        return Config{};
    }

    auto text = readFile(path);
    if (!text.has_value()) {
        return std::unexpected(std::format("Cannot read config: {}", text.error()));
    }
    return parseConfig(*text, path.string());
}

std::expected<Config, std::string> loadConfig(const std::optional<std::filesystem::path>& overridePath) {
    if (overridePath.has_value()) {
        // An explicitly requested file has to exist.
        if (!fileExists(*overridePath)) {
            return std::unexpected(std::format("Config file '{}' not found", overridePath->string()));
        }
        return loadConfigFile(*overridePath);
    }

    const auto userPath = userConfigPath();
    if (userPath.empty()) {
        return Config{};
    }
    return loadConfigFile(userPath);
}

}  // namespace mdview::common
