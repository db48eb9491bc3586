#include "tracevia/common/Logger.h"

#ifdef TRACEVIA_USE_SPDLOG
#include "tracevia/backends/SpdlogBackend.h"
#else
#include "tracevia/backends/DefaultBackend.h"
#endif

#include <cctype>
#include <mutex>

namespace tracevia {

namespace {
    std::unique_ptr<ILoggerBackend> backend_;
    std::mutex backendMutex_;

    bool captureEnabled_ = false;
    std::vector<std::string> capturedLogs_;
    std::mutex captureMutex_;

    std::unique_ptr<ILoggerBackend> createDefaultBackend(
        [[maybe_unused]] const std::string& logDir,
        [[maybe_unused]] bool logToFile) {
#ifdef TRACEVIA_USE_SPDLOG
        return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
        return std::make_unique<DefaultBackend>();
#endif
    }
}  // anonymous namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex_);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex_);
    if (!backend_) {
        backend_ = createDefaultBackend(logDir, logToFile);
    }
}

ILoggerBackend& Logger::backend() {
    std::lock_guard<std::mutex> lock(backendMutex_);
    if (!backend_) {
        backend_ = createDefaultBackend("", false);
    }
    return *backend_;
}

void Logger::setLevel(LogLevel level) {
    backend().setLevel(level);
}

void Logger::write(LogLevel level, const char* tag, const std::string& message,
                   const std::source_location& loc) {
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    backend().log(level, enhanced, loc);
    captureLog(std::string("[") + tag + "] " + enhanced);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, "trace", message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, "debug", message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, "info", message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, "warn", message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, "error", message, loc);
}

void Logger::flush() {
    backend().flush();
}

// ===== Log Capture Implementation =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex_);
    captureEnabled_ = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(captureMutex_);
    return captureEnabled_;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(captureMutex_);

    std::vector<std::string> result;
    for (const auto& line : capturedLogs_) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    // Keep the most recent lines
    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(result.size() - maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex_);
    capturedLogs_.clear();
}

void Logger::captureLog(const std::string& message) {
    std::lock_guard<std::mutex> lock(captureMutex_);
    if (captureEnabled_) {
        capturedLogs_.push_back(message);
    }
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "Unknown";
    }

    // Last space outside template brackets separates the return type
    int depth = 0;
    size_t nameStart = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') depth++;
        else if (c == '>') depth--;
        else if (c == ' ' && depth == 0) nameStart = i + 1;
    }

    std::string result;
    depth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') depth++;
        else if (c == '>') depth--;
        else if (depth == 0) result += c;
    }

    while (!result.empty() && (std::isspace(static_cast<unsigned char>(result.front())) ||
                               result.front() == '*' || result.front() == '&')) {
        result.erase(0, 1);
    }
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "Unknown" : result;
}

}  // namespace tracevia
