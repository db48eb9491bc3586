#pragma once

#include <source_location>
#include <string>

namespace tracevia {

/**
 * @brief Log severity, lowest first
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
 * @brief Sink for routing diagnostics
 *
 * The host application can forward tracevia logs into its own logging
 * system by implementing this interface and handing it to
 * Logger::setBackend().
 *
 * @code
 * class HostLogger : public tracevia::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_->write(static_cast<int>(level), message, loc.line());
 *     }
 *     void setLevel(LogLevel level) override { min_ = level; }
 *     void flush() override {}
 * };
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Write one already formatted message
     * @param level Severity
     * @param message Formatted text (function name prefix included)
     * @param loc Call site
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /// Drop messages below this level
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace tracevia
