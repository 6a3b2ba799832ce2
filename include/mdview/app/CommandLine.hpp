#pragma once

#include "mdview/render/PipelineError.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace mdview::app {

/// Flags as given on the command line, before config defaults are applied.
struct CommandLine {
    std::string inputPath = "-";
    bool preview = false;
    std::optional<bool> style;
    std::optional<std::filesystem::path> configPath;
    bool verbose = false;
    bool showHelp = false;
};

/// Parses arguments (without the program name). Flags take one or two leading
/// dashes; values are given as "-i file" or "-i=file", booleans as "-style" or
/// "-style=false".
std::expected<CommandLine, render::PipelineError> parseCommandLine(std::span<const std::string_view> args);

void printUsage(std::ostream& out, std::string_view programName);

}  // namespace mdview::app
