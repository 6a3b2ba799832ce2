#include "mdview/app/CommandLine.hpp"

#include <format>
#include <utility>

namespace mdview::app {
namespace {

using render::ErrorKind;
using render::PipelineError;

PipelineError usageError(std::string message) {
    return PipelineError{ErrorKind::UsageError, std::move(message)};
}

std::optional<bool> parseBool(std::string_view value) {
    if (value == "true" || value == "1" || value == "t" || value == "TRUE" || value == "True") {
        return true;
    }
    if (value == "false" || value == "0" || value == "f" || value == "FALSE" || value == "False") {
        return false;
    }
    return std::nullopt;
}

}  // namespace

std::expected<CommandLine, PipelineError> parseCommandLine(std::span<const std::string_view> args) {
    CommandLine cmd;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        if (arg.size() < 2 || arg.front() != '-') {
            return std::unexpected(usageError(std::format("Unexpected argument '{}'", arg)));
        }

        std::string_view name = arg.substr(arg.starts_with("--") ? 2 : 1);
        std::optional<std::string_view> inlineValue;
        if (const auto eq = name.find('='); eq != std::string_view::npos) {
            inlineValue = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        auto requireValue = [&]() -> std::expected<std::string, PipelineError> {
            if (inlineValue.has_value()) {
                return std::string(*inlineValue);
            }
            if (i + 1 >= args.size()) {
                return std::unexpected(usageError(std::format("Missing value for -{}", name)));
            }
            ++i;
            return std::string(args[i]);
        };

        auto boolValue = [&]() -> std::expected<bool, PipelineError> {
            if (!inlineValue.has_value()) {
                return true;
            }
            auto parsed = parseBool(*inlineValue);
            if (!parsed.has_value()) {
                return std::unexpected(
                    usageError(std::format("Invalid boolean value '{}' for -{}", *inlineValue, name)));
            }
            return *parsed;
        };

        if (name == "h" || name == "help") {
            cmd.showHelp = true;
            continue;
        }
        if (name == "i") {
            auto value = requireValue();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            cmd.inputPath = std::move(*value);
            continue;
        }
        if (name == "config") {
            auto value = requireValue();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            if (value->empty()) {
                return std::unexpected(usageError("-config needs a non-empty path"));
            }
            cmd.configPath = std::filesystem::path(*value);
            continue;
        }
        if (name == "preview") {
            auto value = boolValue();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            cmd.preview = *value;
            continue;
        }
        if (name == "style") {
            auto value = boolValue();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            cmd.style = *value;
            continue;
        }
        if (name == "nostyle") {
            if (inlineValue.has_value()) {
                return std::unexpected(usageError("-nostyle does not take a value"));
            }
            cmd.style = false;
            continue;
        }
        if (name == "v" || name == "verbose") {
            auto value = boolValue();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            cmd.verbose = *value;
            continue;
        }

        return std::unexpected(usageError(std::format("Unknown flag '{}'", arg)));
    }

    return cmd;
}

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " [-i <file.md>] [-style] [-preview] [-config <file.json>] [-v]\n";
    out << "\nConverts Markdown (GitHub flavored, hard line wraps) to HTML on standard output.\n";
    out << "\nOptions:\n";
    out << "  -i <path>        Input file path; '-' reads standard input (default: -)\n";
    out << "  -style           Wrap output in an HTML document with GitHub light CSS\n";
    out << "  -nostyle         Emit the bare HTML fragment even if the config enables style\n";
    out << "  -preview         Render to a temp file, open it in the default viewer, then delete it\n";
    out << "  -config <path>   Config file (default: $XDG_CONFIG_HOME/mdview/config.json)\n";
    out << "  -v               Verbose diagnostics on standard error\n";
    out << "  -h, -help        Show this help\n";
}

}  // namespace mdview::app
