#pragma once

#include "tracevia/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace tracevia {

/**
 * @brief Process-wide logging facade used by the routing code
 *
 * The backend is created lazily on first use (spdlog when the library is
 * built with TRACEVIA_USE_SPDLOG, DefaultBackend otherwise) unless the
 * host injected its own with setBackend().
 *
 * Capture mode keeps a copy of every message in memory so tests can
 * assert on diagnostics such as dropped edges:
 * @code
 * tracevia::Logger::enableCapture(true);
 * router.routeEdges(input);
 * auto warnings = tracevia::Logger::getCapturedLogs("[warn]");
 * @endcode
 *
 * All functions are safe to call from concurrent routing passes.
 */
class Logger {
public:
    /// Replace the backend (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Create the default console backend if none is installed
    static void initialize();

    /**
     * @brief Create the default backend with an additional log file
     * @param logDir Directory receiving tracevia.log
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

    // ===== Log Capture API =====

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /**
     * @brief Captured lines, oldest first
     * @param pattern Substring filter (empty = all lines)
     * @param maxLines Keep only the last N matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static void write(LogLevel level, const char* tag, const std::string& message,
                      const std::source_location& loc);
    static ILoggerBackend& backend();
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace tracevia

// Logging macros with std::format support
#define LOG_TRACE(...) tracevia::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) tracevia::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  tracevia::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  tracevia::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) tracevia::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
