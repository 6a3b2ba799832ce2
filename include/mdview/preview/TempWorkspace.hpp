#pragma once

#include "mdview/render/PipelineError.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace mdview::preview {

constexpr std::string_view kOutputFileName = "out.html";

/// A freshly created, uniquely named temporary directory holding exactly one
/// output file (out.html). Removal is explicit through remove(); callers
/// register it as an exit handler right after create() succeeds.
class TempWorkspace {
public:
    /// Creates <root>/<prefix>-XXXXXX and opens out.html inside it for writing.
    /// An empty root means the system temp directory. If the file cannot be
    /// created the directory is removed again before returning TempFileError.
    static std::expected<TempWorkspace, render::PipelineError> create(const std::filesystem::path& root = {},
                                                                      std::string_view prefix = "mdview");

    TempWorkspace(TempWorkspace&&) = default;
    TempWorkspace& operator=(TempWorkspace&&) = default;
    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }
    [[nodiscard]] const std::filesystem::path& outputPath() const { return outputPath_; }

    /// The sink for this run.
    std::ostream& output() { return output_; }

    /// Flushes and closes out.html. Write errors surface here as RenderError.
    std::expected<void, render::PipelineError> closeOutput();

    /// Recursively deletes the directory. Safe to call more than once.
    std::expected<void, std::string> remove();

private:
    TempWorkspace(std::filesystem::path directory, std::filesystem::path outputPath, std::ofstream output);

    std::filesystem::path directory_;
    std::filesystem::path outputPath_;
    std::ofstream output_;
    bool removed_ = false;
};

}  // namespace mdview::preview
