#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace mdview::preview {

/// Hands a file to whatever the host uses to view HTML.
class ViewerLauncher {
public:
    virtual ~ViewerLauncher() = default;

    /// Returns once the handoff command has returned, not when the viewer closes.
    virtual std::expected<void, std::string> open(const std::filesystem::path& file) = 0;
};

/// "open" on macOS, "xdg-open" elsewhere.
[[nodiscard]] std::string_view defaultViewerCommand();

/// Runs `<command> <file>` without a shell and waits for it to exit.
class SystemViewerLauncher final : public ViewerLauncher {
public:
    explicit SystemViewerLauncher(std::string command = std::string(defaultViewerCommand()));

    std::expected<void, std::string> open(const std::filesystem::path& file) override;

    [[nodiscard]] const std::string& command() const { return command_; }

private:
    std::string command_;
};

}  // namespace mdview::preview
