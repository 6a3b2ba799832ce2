#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mdview::render {

/// Stage that failed. Every kind except CleanupError aborts the run.
enum class ErrorKind : uint8_t {
    UsageError,
    ConfigError,
    InputOpenError,
    InputReadError,
    TempDirError,
    TempFileError,
    TemplateError,
    RenderError,
    LaunchError,
    CleanupError,
};

struct PipelineError {
    ErrorKind kind = ErrorKind::RenderError;
    std::string message;
};

[[nodiscard]] std::string_view errorKindName(ErrorKind kind);

/// "<stage>: <message>", as printed by the command line tool.
[[nodiscard]] std::string describe(const PipelineError& error);

}  // namespace mdview::render
