#pragma once

#include "orthograph/common/ILoggerBackend.h"
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace orthograph {

/**
 * @brief Default Logger backend built on spdlog
 *
 * Console sink always; a file sink under logDir when requested.
 * LOG_LEVEL (or SPDLOG_LEVEL) overrides the initial level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /// Parse a level name ("info", "warning", "err", ...), case-insensitive.
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace orthograph
