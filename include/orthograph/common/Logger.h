#pragma once

#include "orthograph/common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace orthograph {

/**
 * @brief Process-wide logging facade used by every layout stage
 *
 * The backend is created lazily (spdlog console sink) unless the host
 * installs its own with setBackend(). Capture mode additionally keeps every
 * formatted record in memory so tests can assert on diagnostics.
 *
 * @code
 * orthograph::Logger::enableCapture(true);
 * LOG_WARN("overlap resolution stopped after {} iterations", n);
 * auto lines = orthograph::Logger::getCapturedLogs("overlap");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Replace the active backend
     * @param backend New backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Install the spdlog console backend if none is set
     */
    static void initialize();

    /**
     * @brief Install the spdlog backend with an optional log file
     * @param logDir Directory that receives orthograph.log
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Capture =====

    /**
     * @brief Start or stop keeping records in memory
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Captured records, oldest first
     * @param pattern Substring filter (empty keeps everything)
     * @param maxLines Keep only the last N matches (0 = all)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const char* tag,
                         const std::string& message, const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace orthograph

// Logging macros, fmt-style format strings
#define LOG_TRACE(...) orthograph::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) orthograph::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  orthograph::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  orthograph::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) orthograph::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
