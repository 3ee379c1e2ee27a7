/**
 * @file log.cpp
 * @brief spdlog-backed process logger.
 */
#include "relay/obs/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace relay::obs {

namespace {
std::mutex g_init_mu;
} // namespace

std::shared_ptr<spdlog::logger> init_logging(std::string_view level) {
    std::lock_guard<std::mutex> lk(g_init_mu);
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto lvl = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off; only "off" itself should silence the logger.
    if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

spdlog::logger& log() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) return existing;
        return init_logging("info");
    }();
    return *logger;
}

} // namespace relay::obs
