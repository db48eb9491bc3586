#include "tracevia/backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tracevia {

namespace {
    constexpr const char* LOGGER_NAME = "tracevia";
    constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
    constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
}

std::shared_ptr<spdlog::logger> SpdlogBackend::createLogger(const std::string& logDir, bool logToFile) {
    // Several backends may be created over a process lifetime (tests swap them)
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(consoleSink);

    if (logToFile && !logDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        if (!ec) {
            std::filesystem::path logPath = std::filesystem::path(logDir) / "tracevia.log";
            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
            fileSink->set_pattern(FILE_PATTERN);
            sinks.push_back(fileSink);
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    return logger;
}

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile)
    : logger_(createLogger(logDir, logToFile)) {

    logger_->set_level(spdlog::level::debug);

    const char* envLevel = std::getenv("LOG_LEVEL");
    if (!envLevel) {
        envLevel = std::getenv("SPDLOG_LEVEL");
    }

    if (envLevel) {
        std::string levelStr(envLevel);
        std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (levelStr == "trace") logger_->set_level(spdlog::level::trace);
        else if (levelStr == "debug") logger_->set_level(spdlog::level::debug);
        else if (levelStr == "info") logger_->set_level(spdlog::level::info);
        else if (levelStr == "warn" || levelStr == "warning") logger_->set_level(spdlog::level::warn);
        else if (levelStr == "err" || levelStr == "error") logger_->set_level(spdlog::level::err);
        else if (levelStr == "critical") logger_->set_level(spdlog::level::critical);
        else if (levelStr == "off") logger_->set_level(spdlog::level::off);
    }
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
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
    return spdlog::level::debug;
}

}  // namespace tracevia
