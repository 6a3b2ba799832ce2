#include "mdview/render/PipelineError.hpp"

#include <format>

namespace mdview::render {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UsageError:
        return "usage";
    case ErrorKind::ConfigError:
        return "config";
    case ErrorKind::InputOpenError:
        return "input open";
    case ErrorKind::InputReadError:
        return "input read";
    case ErrorKind::TempDirError:
        return "temp directory";
    case ErrorKind::TempFileError:
        return "temp file";
    case ErrorKind::TemplateError:
        return "template";
    case ErrorKind::RenderError:
        return "render";
    case ErrorKind::LaunchError:
        return "launch";
    case ErrorKind::CleanupError:
        return "cleanup";
    }
    return "unknown";
}

std::string describe(const PipelineError& error) {
    return std::format("{}: {}", errorKindName(error.kind), error.message);
}

}  // namespace mdview::render
