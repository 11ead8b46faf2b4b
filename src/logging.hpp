#pragma once

#include <memory>
#include <sstream>
#include <string>
#include "spdlog/spdlog.h"

namespace assetlock::logging {

using Logger = std::shared_ptr<spdlog::logger>;

// Returns the named logger, creating a stderr logger on first use
Logger get_logger(const std::string& name);

// Applies a level name ("trace", "debug", "info", "warn", "error",
// "critical", "off") to every logger
void set_level(const std::string& level);

} // namespace assetlock::logging

// Stream-style logging; the message is only formatted when the level is on
#define ASSETLOCK_LOG(logger, level, method, message) \
    {                                                 \
        if ((logger)->should_log(level)) {            \
            std::ostringstream log_stream_;           \
            log_stream_ << message;                   \
            (logger)->method(log_stream_.str());      \
        }                                             \
    }

#define LOG_TRACE(l, s) ASSETLOCK_LOG(l, spdlog::level::trace, trace, s)
#define LOG_DEBUG(l, s) ASSETLOCK_LOG(l, spdlog::level::debug, debug, s)
#define LOG_INFO(l, s) ASSETLOCK_LOG(l, spdlog::level::info, info, s)
#define LOG_WARN(l, s) ASSETLOCK_LOG(l, spdlog::level::warn, warn, s)
#define LOG_ERROR(l, s) ASSETLOCK_LOG(l, spdlog::level::err, error, s)
#define LOG_FATAL(l, s) ASSETLOCK_LOG(l, spdlog::level::critical, critical, s)
