/**
 * @file logger.h
 * @brief spdlog setup for the cert-monitor executable
 *
 * Console output goes to stderr; stdout is reserved for the Report JSON.
 *
 * @author SmartCore Inc.
 * @date 2026-09-14
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "exceptions.h"

namespace certmon::common {

class Logger {
public:
    static constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
    static constexpr size_t LOG_FILE_MAX_FILES = 3;

    /**
     * @brief Install the default logger
     * @param serviceName Logger name shown in every line
     * @param level trace, debug, info, warn, error or critical
     * @param logToFile Also write to logFile
     * @param logFile Rotating log file path
     * @throws ConfigException on an unknown level or an unusable log file
     */
    static void initialize(const std::string& serviceName,
                           const std::string& level = "info",
                           bool logToFile = false,
                           const std::string& logFile = "") {
        auto parsed = parseLevel(level);
        if (!parsed) {
            throw ConfigException("unknown log level '" + level + "'");
        }

        std::vector<spdlog::sink_ptr> sinks;
        auto stderrSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        stderrSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        sinks.push_back(stderrSink);

        if (logToFile && !logFile.empty()) {
            try {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, LOG_FILE_MAX_BYTES, LOG_FILE_MAX_FILES);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            } catch (const spdlog::spdlog_ex& ex) {
                throw ConfigException("cannot open log file '" + logFile + "': " + ex.what());
            }
        }

        auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
        logger->set_level(*parsed);
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        spdlog::debug("Logger initialized: level={}, file={}", level, sinks.size() > 1 ? logFile : "none");
    }

    /// Level for a name, or std::nullopt if the name is not a level
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        return std::nullopt;
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace certmon::common
