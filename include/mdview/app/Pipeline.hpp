#pragma once

#include "mdview/app/CommandLine.hpp"
#include "mdview/common/Config.hpp"
#include "mdview/preview/TempWorkspace.hpp"
#include "mdview/preview/ViewerLauncher.hpp"
#include "mdview/render/MarkdownConverter.hpp"
#include "mdview/render/PipelineError.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace mdview::app {

struct RunOptions {
    std::string inputPath = "-";
    bool preview = false;
    bool style = false;
    render::ConvertOptions convert;
    /// Replacement stylesheet; the built-in one when unset.
    std::optional<std::filesystem::path> stylesheet;
    /// Pause between handing the file to the viewer and deleting it.
    std::chrono::milliseconds previewDelay{common::kDefaultPreviewDelayMs};
    /// Parent of the preview directory; the system temp directory when empty.
    std::filesystem::path tempRoot;
};

/// Merges config defaults with the command line; the command line wins.
RunOptions resolveRunOptions(const CommandLine& cmd, const common::Config& config);

/// Reports a failure on stderr and in the log file as "<stage>: <message>".
void logFailure(const render::PipelineError& error);

/// One run: read input, pick the sink, optionally wrap in the styled document,
/// convert, and in preview mode open the result and delete it again.
class Pipeline {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;
    using RemoveFn = std::function<std::expected<void, std::string>(preview::TempWorkspace&)>;

    Pipeline(RunOptions options, std::istream& in, std::ostream& out, preview::ViewerLauncher& launcher);

    /// Replaces the post-launch sleep, mostly for tests.
    void setSleepFunction(SleepFn sleep) { sleep_ = std::move(sleep); }
    /// Replaces how the preview directory is deleted, mostly for tests.
    void setWorkspaceRemover(RemoveFn remove) { remove_ = std::move(remove); }

    std::expected<void, render::PipelineError> run();

    /// Directory used by the last preview run, empty otherwise.
    [[nodiscard]] const std::filesystem::path& lastPreviewDirectory() const { return lastPreviewDirectory_; }

    /// Cleanup handlers that failed during the last run. They never fail the run.
    [[nodiscard]] int cleanupFailures() const { return cleanupFailures_; }

private:
    RunOptions options_;
    std::istream& in_;
    std::ostream& out_;
    preview::ViewerLauncher& launcher_;
    SleepFn sleep_;
    RemoveFn remove_;
    std::filesystem::path lastPreviewDirectory_;
    int cleanupFailures_ = 0;
};

}  // namespace mdview::app
