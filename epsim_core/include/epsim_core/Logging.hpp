#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <epsim_core/Env.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define EPSIM_LOG_AT(logger, level, ...)                                                             \
    do {                                                                                             \
        if (logger->should_log(level)) {                                                             \
            logger->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, level, __VA_ARGS__); \
        }                                                                                            \
    } while (false)

#define EPSIM_LOG_TRACE(logger, ...) EPSIM_LOG_AT(logger, spdlog::level::trace, __VA_ARGS__)
#define EPSIM_LOG_DEBUG(logger, ...) EPSIM_LOG_AT(logger, spdlog::level::debug, __VA_ARGS__)
#define EPSIM_LOG_INFO(logger, ...) EPSIM_LOG_AT(logger, spdlog::level::info, __VA_ARGS__)
#define EPSIM_LOG_WARN(logger, ...) EPSIM_LOG_AT(logger, spdlog::level::warn, __VA_ARGS__)
#define EPSIM_LOG_ERROR(logger, ...) EPSIM_LOG_AT(logger, spdlog::level::err, __VA_ARGS__)
#define EPSIM_LOG_FATAL(logger, ...) EPSIM_LOG_AT(logger, spdlog::level::critical, __VA_ARGS__)

#define __EPSIM_LOG_THROTTLE_CHECK(now, last, period) (last + period <= now || now < last)

#define EPSIM_LOG_AT_THROTTLE(logger, level, period, ...)                                               \
    do {                                                                                                \
        thread_local double __log_throttle_last_hit__ = 0.0;                                            \
        double __log_throttle_now__ =                                                                   \
            std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count(); \
        if (__EPSIM_LOG_THROTTLE_CHECK(__log_throttle_now__, __log_throttle_last_hit__, period)) {      \
            __log_throttle_last_hit__ = __log_throttle_now__;                                           \
            EPSIM_LOG_AT(logger, level, __VA_ARGS__);                                                   \
        }                                                                                               \
    } while (false)

#define EPSIM_LOG_DEBUG_THROTTLE(logger, period, ...) \
    EPSIM_LOG_AT_THROTTLE(logger, spdlog::level::debug, period, __VA_ARGS__)
#define EPSIM_LOG_INFO_THROTTLE(logger, period, ...) \
    EPSIM_LOG_AT_THROTTLE(logger, spdlog::level::info, period, __VA_ARGS__)
#define EPSIM_LOG_WARN_THROTTLE(logger, period, ...) \
    EPSIM_LOG_AT_THROTTLE(logger, spdlog::level::warn, period, __VA_ARGS__)

namespace epsim {

/**
 * @brief Get a named logger. Sinks and levels are taken from the environment:
 * EPSIM_LOG_LEVEL, EPSIM_LOG_TO_CONSOLE, EPSIM_LOG_FOLDER and EPSIM_LOG_FILE_LEVEL.
 *
 * @param name : logger name, also used as the log file name
 * @return std::shared_ptr<spdlog::logger> : logger
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string &name);

}  // namespace epsim
