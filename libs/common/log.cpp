/**
 * @file log.cpp
 * @brief Logger setup for the CLI and tests
 */

#include "reposlice/log.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace reposlice::log {

reposlice::Result<spdlog::level::level_enum> parse_level(std::string_view name)
{
    if (name == "trace") {
        return spdlog::level::trace;
    }
    if (name == "debug") {
        return spdlog::level::debug;
    }
    if (name == "info") {
        return spdlog::level::info;
    }
    if (name == "warn" || name == "warning") {
        return spdlog::level::warn;
    }
    if (name == "error") {
        return spdlog::level::err;
    }
    if (name == "off") {
        return spdlog::level::off;
    }
    return std::unexpected(
        Error::make("ConfigError", "Unknown log level: " + std::string(name)));
}

void init_logging(spdlog::level::level_enum level)
{
    auto logger = spdlog::get("reposlice");
    if (!logger) {
        logger = spdlog::stderr_color_mt("reposlice");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

}  // namespace reposlice::log
