#include "mdview/preview/TempWorkspace.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <unistd.h>
#include <utility>
#include <vector>

namespace mdview::preview {

using render::ErrorKind;
using render::PipelineError;

TempWorkspace::TempWorkspace(std::filesystem::path directory, std::filesystem::path outputPath, std::ofstream output)
    : directory_(std::move(directory)), outputPath_(std::move(outputPath)), output_(std::move(output)) {}

std::expected<TempWorkspace, PipelineError> TempWorkspace::create(const std::filesystem::path& root,
                                                                  std::string_view prefix) {
    std::filesystem::path base = root;
    if (base.empty()) {
        std::error_code ec;
        base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return std::unexpected(PipelineError{
                ErrorKind::TempDirError, std::format("Failed to resolve temp directory: {}", ec.message())});
        }
    }

    const std::string pattern = (base / std::format("{}-XXXXXX", prefix)).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        const int err = errno;
        return std::unexpected(PipelineError{
            ErrorKind::TempDirError,
            std::format("Failed to create temp directory under '{}': {}", base.string(), std::strerror(err))});
    }

    std::filesystem::path directory(buffer.data());
    auto outputPath = directory / kOutputFileName;

    errno = 0;
    std::ofstream output(outputPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        const int err = errno;
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
        std::string message = std::format("Failed to create '{}'", outputPath.string());
        if (err != 0) {
            message += std::format(": {}", std::strerror(err));
        }
        if (ec) {
            message += std::format(" (and failed to remove '{}': {})", directory.string(), ec.message());
        }
        return std::unexpected(PipelineError{ErrorKind::TempFileError, std::move(message)});
    }

    return TempWorkspace(std::move(directory), std::move(outputPath), std::move(output));
}

std::expected<void, PipelineError> TempWorkspace::closeOutput() {
    if (!output_.is_open()) {
        return {};
    }
    output_.flush();
    const bool flushed = output_.good();
    output_.close();
    if (!flushed || output_.fail()) {
        return std::unexpected(
            PipelineError{ErrorKind::RenderError, std::format("Failed while writing '{}'", outputPath_.string())});
    }
    return {};
}

std::expected<void, std::string> TempWorkspace::remove() {
    if (removed_ || directory_.empty()) {
        return {};
    }
    if (output_.is_open()) {
        output_.close();
    }

    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
    if (ec) {
        return std::unexpected(
            std::format("Failed to remove temporary directory '{}': {}", directory_.string(), ec.message()));
    }
    removed_ = true;
    return {};
}

}  // namespace mdview::preview
