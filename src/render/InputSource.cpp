#include "mdview/render/InputSource.hpp"

#include "mdview/common/FileIo.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <utility>

namespace mdview::render {

bool isStdinPath(std::string_view path) {
    return path.empty() || path == kStdinPath;
}

std::expected<std::string, PipelineError> readAll(std::istream& in, std::string_view sourceName) {
    auto content = common::readStream(in);
    if (!content.has_value()) {
        return std::unexpected(PipelineError{
            ErrorKind::InputReadError,
            std::format("Failed while reading Markdown from {}: {}", sourceName, content.error())});
    }
    return std::move(*content);
}

std::expected<std::string, PipelineError> readInput(std::string_view path, std::istream& stdinStream) {
    if (isStdinPath(path)) {
        return readAll(stdinStream, "standard input");
    }

    const std::filesystem::path filePath(path);
    std::error_code ec;
    if (std::filesystem::is_directory(filePath, ec)) {
        return std::unexpected(
            PipelineError{ErrorKind::InputOpenError, std::format("'{}' is a directory", filePath.string())});
    }

    errno = 0;
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        const int openErrno = errno;
        return std::unexpected(PipelineError{
            ErrorKind::InputOpenError,
            openErrno != 0 ? std::format("Failed to open '{}': {}", filePath.string(), std::strerror(openErrno))
                           : std::format("Failed to open '{}'", filePath.string())});
    }
    return readAll(in, std::format("'{}'", filePath.string()));
}

}  // namespace mdview::render
