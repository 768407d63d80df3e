#include "orthograph/common/Logger.h"
#include "orthograph/backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace orthograph {

std::unique_ptr<ILoggerBackend> Logger::backend_;
static std::mutex backend_mutex;

static bool capture_enabled_ = false;
static std::vector<std::string> captured_logs_;
static std::mutex capture_mutex_;

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, "trace", message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, "debug", message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, "info", message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, "warn", message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, "error", message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::dispatch(LogLevel level, const char* tag,
                      const std::string& message, const std::source_location& loc) {
    ensureBackend();
    std::string line = extractFunctionName(loc) + "() - " + message;
    backend_->log(level, line, loc);
    captureLog(std::string("[") + tag + "] " + line);
}

// ===== Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    capture_enabled_ = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return capture_enabled_;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(capture_mutex_);

    std::vector<std::string> matches;
    for (const auto& line : captured_logs_) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            matches.push_back(line);
        }
    }

    if (maxLines > 0 && matches.size() > maxLines) {
        matches.erase(matches.begin(), matches.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return matches;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    captured_logs_.clear();
}

void Logger::captureLog(const std::string& message) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (capture_enabled_) {
        captured_logs_.push_back(message);
    }
}

// "float orthograph::grid::snap<T>(float, float)" -> "orthograph::grid::snap"
std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string signature = loc.function_name();

    size_t paren = signature.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (c == ' ' && depth == 0) start = i + 1;
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0) name += c;
    }

    size_t first = 0;
    while (first < name.size() &&
           (std::isspace(static_cast<unsigned char>(name[first])) || name[first] == '*' || name[first] == '&')) {
        ++first;
    }
    name.erase(0, first);
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.pop_back();
    }

    return name.empty() ? "Unknown" : name;
}

}  // namespace orthograph
