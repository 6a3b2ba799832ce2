#include "mdview/preview/ViewerLauncher.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace mdview::preview {

std::string_view defaultViewerCommand() {
#if defined(__APPLE__)
    return "open";
#else
    return "xdg-open";
#endif
}

SystemViewerLauncher::SystemViewerLauncher(std::string command) : command_(std::move(command)) {}

std::expected<void, std::string> SystemViewerLauncher::open(const std::filesystem::path& file) {
    if (command_.empty()) {
        return std::unexpected("No viewer command configured");
    }

    std::string program = command_;
    std::string argument = file.string();
    char* argv[] = {program.data(), argument.data(), nullptr};

    // Viewer chatter on stdout is not ours to print. The descriptor itself must
    // not survive into the child beyond the dup2 onto stdout.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    const int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (devnull >= 0) {
        posix_spawn_file_actions_adddup2(&actions, devnull, STDOUT_FILENO);
    }

    pid_t pid = 0;
    const int spawnError = posix_spawnp(&pid, argv[0], &actions, nullptr, argv, environ);

    posix_spawn_file_actions_destroy(&actions);
    if (devnull >= 0) {
        close(devnull);
    }

    if (spawnError != 0) {
        return std::unexpected(std::format("Failed to run '{}': {}", command_, std::strerror(spawnError)));
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(std::format("Failed to wait for '{}': {}", command_, std::strerror(errno)));
        }
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected(std::format("'{}' was killed by signal {}", command_, WTERMSIG(status)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::unexpected(std::format("'{} {}' exited with status {}", command_, argument, WEXITSTATUS(status)));
    }
    return {};
}

}  // namespace mdview::preview
