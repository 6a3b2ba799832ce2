#pragma once

#include "mdview/render/PipelineError.hpp"

#include <expected>
#include <istream>
#include <string>
#include <string_view>

namespace mdview::render {

/// Path value meaning "read standard input".
constexpr std::string_view kStdinPath = "-";

[[nodiscard]] bool isStdinPath(std::string_view path);

/// Reads the whole stream into memory.
std::expected<std::string, PipelineError> readAll(std::istream& in, std::string_view sourceName);

/// Reads the Markdown source named by `path`. An empty path or kStdinPath reads
/// `stdinStream` until end of stream; anything else is opened as a file.
std::expected<std::string, PipelineError> readInput(std::string_view path, std::istream& stdinStream);

}  // namespace mdview::render
