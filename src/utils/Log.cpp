#include "utils/Log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace LoomUtils {

    namespace {
        std::atomic<LogLevel> currentLevel{LogLevel::INFO};

        // Poller threads log concurrently; keep whole lines together.
        std::mutex outputMutex;

        void emit(std::ostream& out, const std::string& component, const std::string& message) {
            std::lock_guard<std::mutex> lock(outputMutex);
            out << "[" << component << "] " << message << std::endl;
        }

        bool enabled(LogLevel level) {
            return static_cast<int>(level) <= static_cast<int>(currentLevel.load());
        }
    }

    void setLogLevel(LogLevel level) {
        currentLevel.store(level);
    }

    LogLevel getLogLevel() {
        return currentLevel.load();
    }

    LogLevel parseLogLevel(const std::string& name) {
        if (name == "silent") return LogLevel::SILENT;
        if (name == "warn") return LogLevel::WARN;
        if (name == "info") return LogLevel::INFO;
        if (name == "debug") return LogLevel::DEBUG;
        throw std::invalid_argument("Unknown log level: " + name);
    }

    void logError(const std::string& component, const std::string& message) {
        if (enabled(LogLevel::WARN)) emit(std::cerr, component, "ERROR: " + message);
    }

    void logWarn(const std::string& component, const std::string& message) {
        if (enabled(LogLevel::WARN)) emit(std::cerr, component, "WARN: " + message);
    }

    void logInfo(const std::string& component, const std::string& message) {
        if (enabled(LogLevel::INFO)) emit(std::cout, component, message);
    }

    void logDebug(const std::string& component, const std::string& message) {
        if (enabled(LogLevel::DEBUG)) emit(std::cout, component, message);
    }
}
