#pragma once

#include "tracevia/common/ILoggerBackend.h"
#include <mutex>

namespace tracevia {

/**
 * @brief stderr logger with no external dependencies
 *
 * Used when the library is built with TRACEVIA_USE_SPDLOG=OFF.
 * Lines look like `[12:03:44.120] [warn] message`.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    static const char* levelToString(LogLevel level);
    static std::string getTimestamp();
};

}  // namespace tracevia
