#include "mdview/app/Pipeline.hpp"

#include "mdview/common/ExitStack.hpp"
#include "mdview/common/Logger.hpp"
#include "mdview/preview/TempWorkspace.hpp"
#include "mdview/render/InputSource.hpp"
#include "mdview/render/StyleWrapper.hpp"

#include <format>
#include <thread>
#include <utility>

namespace mdview::app {

using common::Logger;
using render::ErrorKind;
using render::PipelineError;

void logFailure(const PipelineError& error) {
    Logger::logError(render::describe(error));
}

RunOptions resolveRunOptions(const CommandLine& cmd, const common::Config& config) {
    RunOptions options;
    options.inputPath = cmd.inputPath;
    options.preview = cmd.preview;
    options.style = cmd.style.value_or(config.style.value_or(false));
    options.convert.hardWraps = true;
    options.convert.allowRawHtml = config.unsafeHtml.value_or(false);
    options.stylesheet = config.stylesheet;
    options.previewDelay = std::chrono::milliseconds(config.previewDelayMs.value_or(common::kDefaultPreviewDelayMs));
    return options;
}

Pipeline::Pipeline(RunOptions options, std::istream& in, std::ostream& out, preview::ViewerLauncher& launcher)
    : options_(std::move(options)), in_(in), out_(out), launcher_(launcher),
      sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }),
      remove_([](preview::TempWorkspace& workspace) { return workspace.remove(); }) {}

std::expected<void, PipelineError> Pipeline::run() {
    lastPreviewDirectory_.clear();
    cleanupFailures_ = 0;

    auto markdown = render::readInput(options_.inputPath, in_);
    if (!markdown.has_value()) {
        return std::unexpected(markdown.error());
    }
    Logger::log(std::format("read {} bytes from {}", markdown->size(),
                            render::isStdinPath(options_.inputPath) ? std::string("standard input")
                                                                    : std::format("'{}'", options_.inputPath)));

    // Declared before the exit stack so the handlers below outlive nothing they use.
    std::optional<preview::TempWorkspace> workspace;
    common::ExitStack exits;
    exits.setFailureHandler([this](const std::string& name, const std::string& error) {
        ++cleanupFailures_;
        logFailure(PipelineError{ErrorKind::CleanupError, std::format("{}: {}", name, error)});
    });

    std::ostream* sink = &out_;
    if (options_.preview) {
        auto created = preview::TempWorkspace::create(options_.tempRoot);
        if (!created.has_value()) {
            return std::unexpected(created.error());
        }
        workspace.emplace(std::move(*created));
        lastPreviewDirectory_ = workspace->directory();
        exits.push("remove temp directory", [this, &workspace] { return remove_(*workspace); });
        sink = &workspace->output();
        Logger::log(std::format("rendering to '{}'", workspace->outputPath().string()));
    }

    std::optional<render::StyleWrapper> wrapper;
    if (options_.style) {
        auto css = render::loadStylesheet(options_.stylesheet);
        if (!css.has_value()) {
            return std::unexpected(css.error());
        }
        wrapper.emplace(std::move(*css));
        auto began = wrapper->begin(*sink);
        if (!began.has_value()) {
            return std::unexpected(began.error());
        }
    }

    auto converted = render::convertMarkdown(*markdown, *sink, options_.convert);
    if (!converted.has_value()) {
        return std::unexpected(converted.error());
    }

    if (wrapper.has_value()) {
        auto finished = wrapper->finish(*sink);
        if (!finished.has_value()) {
            return std::unexpected(finished.error());
        }
    }

    if (workspace.has_value()) {
        auto closed = workspace->closeOutput();
        if (!closed.has_value()) {
            return std::unexpected(closed.error());
        }
    } else {
        out_.flush();
        if (!out_.good()) {
            return std::unexpected(PipelineError{ErrorKind::RenderError, "Failed to flush standard output"});
        }
    }

    if (workspace.has_value()) {
        auto opened = launcher_.open(workspace->outputPath());
        // The viewer may still be reading the file; there is no reliable signal
        // for "done", so the directory is only removed after a fixed delay.
        if (options_.previewDelay.count() > 0) {
            sleep_(options_.previewDelay);
        }
        if (!opened.has_value()) {
            return std::unexpected(PipelineError{ErrorKind::LaunchError, opened.error()});
        }
        Logger::log(std::format("opened '{}' in the default viewer", workspace->outputPath().string()));
    }

    exits.runAll();
    return {};
}

}  // namespace mdview::app
