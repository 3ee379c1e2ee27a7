#pragma once
/**
 * @file log.hpp
 * @brief Process logger (spdlog) shared by every relay component.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace relay::obs {

/// Name of the registered spdlog logger.
inline constexpr const char* kLoggerName = "relay";

/**
 * @brief Create (or reconfigure) the colored stderr logger.
 * @param level spdlog level name: trace, debug, info, warn, error, critical, off.
 *              Unknown names fall back to info.
 * @return The logger, also registered under kLoggerName.
 */
std::shared_ptr<spdlog::logger> init_logging(std::string_view level);

/// @brief Logger used by all components; created at info level on first use.
spdlog::logger& log();

} // namespace relay::obs
