#include "mdview/app/CommandLine.hpp"
#include "mdview/app/Pipeline.hpp"
#include "mdview/common/Config.hpp"
#include "mdview/common/Logger.hpp"
#include "mdview/preview/ViewerLauncher.hpp"
#include "mdview/render/PipelineError.hpp"

#include <iostream>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

int runTool(int argc, char** argv) {
    const std::string_view programName = argc > 0 ? argv[0] : "mdview";
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    auto cmd = mdview::app::parseCommandLine(args);
    if (!cmd.has_value()) {
        mdview::app::logFailure(cmd.error());
        mdview::app::printUsage(std::cerr, programName);
        return kExitUsage;
    }
    if (cmd->showHelp) {
        mdview::app::printUsage(std::cout, programName);
        return 0;
    }

    auto config = mdview::common::loadConfig(cmd->configPath);
    if (!config.has_value()) {
        // The log file comes from the config, so only stderr sees this one.
        mdview::app::logFailure({mdview::render::ErrorKind::ConfigError, config.error()});
        return kExitFailure;
    }

    mdview::common::Logger::init({.verbose = cmd->verbose, .logFile = config->logFile.value_or("")});

    mdview::preview::SystemViewerLauncher launcher(
        config->viewerCommand.value_or(std::string(mdview::preview::defaultViewerCommand())));
    mdview::app::Pipeline pipeline(mdview::app::resolveRunOptions(*cmd, *config), std::cin, std::cout, launcher);

    auto result = pipeline.run();
    if (!result.has_value()) {
        mdview::app::logFailure(result.error());
        mdview::common::Logger::shutdown();
        return kExitFailure;
    }

    mdview::common::Logger::shutdown();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    return runTool(argc, argv);
}
