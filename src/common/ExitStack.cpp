#include "mdview/common/ExitStack.hpp"

#include "mdview/common/Logger.hpp"

#include <format>
#include <utility>

namespace mdview::common {

ExitStack::~ExitStack() {
    runAll();
}

void ExitStack::push(std::string name, Handler handler) {
    handlers_.push_back(Entry{std::move(name), std::move(handler)});
}

int ExitStack::runAll() {
    int failures = 0;
    while (!handlers_.empty()) {
        // Pop before running so a handler can never run twice.
        Entry entry = std::move(handlers_.back());
        handlers_.pop_back();

        if (!entry.handler) {
            continue;
        }
        auto result = entry.handler();
        if (!result.has_value()) {
            ++failures;
            if (onFailure_) {
                onFailure_(entry.name, result.error());
            } else {
                Logger::logError(std::format("cleanup: {}: {}", entry.name, result.error()));
            }
        } else {
            Logger::log(std::format("cleanup: {} done", entry.name));
        }
    }
    return failures;
}

}  // namespace mdview::common
