#ifndef LOOM_LOG_HPP
#define LOOM_LOG_HPP

#include <string>

namespace LoomUtils {

    /**
     * @brief Process-wide verbosity. Output lines look like "[Component] message".
     */
    enum class LogLevel { SILENT, WARN, INFO, DEBUG };

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel();

    // "silent", "warn", "info", "debug" (case-sensitive); throws std::invalid_argument otherwise
    LogLevel parseLogLevel(const std::string& name);

    // WARN and above go to stderr
    void logError(const std::string& component, const std::string& message);
    void logWarn(const std::string& component, const std::string& message);

    void logInfo(const std::string& component, const std::string& message);
    void logDebug(const std::string& component, const std::string& message);
}

#endif
