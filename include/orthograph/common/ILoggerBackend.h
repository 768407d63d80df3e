#pragma once

#include <source_location>
#include <string>

namespace orthograph {

/**
 * @brief Severity of a log record
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Sink interface behind the Logger facade
 *
 * Host applications implement this to route orthograph diagnostics into
 * their own logging system.
 *
 * @code
 * class HostLog : public orthograph::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host_->setThreshold(level); }
 *     void flush() override { host_->flush(); }
 * };
 *
 * orthograph::Logger::setBackend(std::make_unique<HostLog>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Emit one record
     * @param level Severity
     * @param message Already formatted text
     * @param loc Call site
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace orthograph
