#pragma once

#include "tracevia/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace tracevia {

/**
 * @brief spdlog-based logger backend
 *
 * Colored console output, optionally mirrored into
 * `<logDir>/tracevia.log`. The level is taken from LOG_LEVEL
 * (or SPDLOG_LEVEL) when set, debug otherwise.
 *
 * Default backend when TRACEVIA_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
    static std::shared_ptr<spdlog::logger> createLogger(const std::string& logDir, bool logToFile);
};

}  // namespace tracevia
