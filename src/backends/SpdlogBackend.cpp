#include "orthograph/backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace orthograph {

namespace {
constexpr const char* LOGGER_NAME = "orthograph";
constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile) {
    // A previous backend may still own the registry entry
    spdlog::drop(LOGGER_NAME);

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto path = std::filesystem::path(logDir) / "orthograph.log";
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
        file->set_pattern(FILE_PATTERN);
        sinks.push_back(file);
    }

    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger_);
    logger_->set_level(spdlog::level::info);

    const char* env = std::getenv("LOG_LEVEL");
    if (!env) {
        env = std::getenv("SPDLOG_LEVEL");
    }
    if (env) {
        if (auto level = parseLevel(env)) {
            logger_->set_level(convertLevel(*level));
        }
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

std::optional<LogLevel> SpdlogBackend::parseLevel(const std::string& name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "trace") return LogLevel::Trace;
    if (key == "debug") return LogLevel::Debug;
    if (key == "info") return LogLevel::Info;
    if (key == "warn" || key == "warning") return LogLevel::Warn;
    if (key == "err" || key == "error") return LogLevel::Error;
    if (key == "critical") return LogLevel::Critical;
    if (key == "off") return LogLevel::Off;
    return std::nullopt;
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace orthograph
