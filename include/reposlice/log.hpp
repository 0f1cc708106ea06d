#pragma once

/**
 * @file log.hpp
 * @brief Logging macros built on spdlog
 *
 * Library code logs through these macros only. The CLI picks the sink and
 * level once at startup with init_logging().
 */

#include "reposlice/common.hpp"

#include <string_view>

#include <spdlog/spdlog.h>

#define REPOSLICE_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define REPOSLICE_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define REPOSLICE_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define REPOSLICE_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define REPOSLICE_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

namespace reposlice::log {

/**
 * Map a level name (trace, debug, info, warn, error, off) to spdlog's enum.
 */
[[nodiscard]] reposlice::Result<spdlog::level::level_enum> parse_level(std::string_view name);

/**
 * Route the default logger to stderr and set its level.
 */
void init_logging(spdlog::level::level_enum level);

}  // namespace reposlice::log
