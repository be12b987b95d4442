#pragma once

#include <string>

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif

#include <spdlog/spdlog.h>

namespace parcelink::logging {

enum class LogLevel { trace, debug, info, warn, error, critical, off };

// Installs the process-wide default logger.
// console: colour stdout sink. file: basic file sink when non-empty.
// With neither, log output is discarded.
void configure_logging(LogLevel level, bool console, const std::string& file = {});

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names map to info.
LogLevel log_level_from_string(const std::string& name);

}  // namespace parcelink::logging

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
