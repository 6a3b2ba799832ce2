#pragma once

#include <filesystem>
#include <string>

namespace mdview::common {

struct LoggerOptions {
    bool verbose = false;
    /// Optional debug log; appended to when set.
    std::filesystem::path logFile;
};

/// Diagnostic logger. Everything goes to stderr because stdout may be the
/// HTML sink. Info lines are only printed in verbose mode; error lines are
/// always printed as "Error: <message>" and also land in the log file.
class Logger {
public:
    static void init(const LoggerOptions& options);
    static void log(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace mdview::common
