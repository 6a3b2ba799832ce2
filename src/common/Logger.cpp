#include "mdview/common/Logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mdview::common {
namespace {

std::ofstream logFile;
std::mutex logMutex;
bool verboseEnabled = false;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

}  // namespace

void Logger::init(const LoggerOptions& options) {
    std::lock_guard<std::mutex> lock(logMutex);
    verboseEnabled = options.verbose;
    if (logFile.is_open()) {
        logFile.close();
    }
    if (options.logFile.empty()) {
        return;
    }
    logFile.open(options.logFile, std::ios::out | std::ios::app);
    if (logFile.is_open()) {
        logFile << "\n=== mdview startup " << timestamp() << " ===\n";
        logFile.flush();
    } else {
        std::cerr << "[mdview] cannot open log file '" << options.logFile.string() << "'\n";
    }
}

void Logger::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (verboseEnabled) {
        std::cerr << "[mdview] " << message << '\n';
    }
    if (logFile.is_open()) {
        logFile << "[INFO ] " << timestamp() << " - " << message << '\n';
        logFile.flush();
    }
}

void Logger::logError(const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cerr << "Error: " << message << '\n';
    if (logFile.is_open()) {
        logFile << "[ERROR] " << timestamp() << " - " << message << '\n';
        logFile.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile << "=== mdview shutdown " << timestamp() << " ===\n\n";
        logFile.close();
    }
    verboseEnabled = false;
}

}  // namespace mdview::common
