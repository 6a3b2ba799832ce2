#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace mdview::common {

/// Explicit list of "on exit" handlers.
/// Usage:
///   ExitStack exits;
///   exits.push("remove temp dir", [&] { return workspace.remove(); });
///   // ... early returns are fine ...
///   exits.runAll();  // or let the destructor do it
///
/// Handlers run in reverse order of registration, each exactly once. A failing
/// handler is logged and the remaining handlers still run.
class ExitStack {
public:
    using Handler = std::function<std::expected<void, std::string>()>;
    /// Told about each failing handler. The default logs "cleanup: <name>: <error>".
    using FailureFn = std::function<void(const std::string& name, const std::string& error)>;

    ExitStack() = default;
    ~ExitStack();

    ExitStack(const ExitStack&) = delete;
    ExitStack& operator=(const ExitStack&) = delete;
    ExitStack(ExitStack&&) = delete;
    ExitStack& operator=(ExitStack&&) = delete;

    void push(std::string name, Handler handler);
    void setFailureHandler(FailureFn onFailure) { onFailure_ = std::move(onFailure); }

    /// Runs every pending handler (newest first) and returns how many failed.
    int runAll();

    [[nodiscard]] size_t pending() const { return handlers_.size(); }

private:
    struct Entry {
        std::string name;
        Handler handler;
    };

    std::vector<Entry> handlers_;
    FailureFn onFailure_;
};

}  // namespace mdview::common
