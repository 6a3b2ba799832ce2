#include "mdview/common/Paths.hpp"

#include <cstdlib>

namespace mdview::common {

std::filesystem::path userConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "mdview";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "mdview";
    }
    return {};
}

std::filesystem::path userConfigPath() {
    const auto dir = userConfigDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "config.json";
}

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

}  // namespace mdview::common
