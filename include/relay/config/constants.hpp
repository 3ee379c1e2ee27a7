#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the relay pipeline.
 * @details Every tunable in RelayConfig starts from one of these values. Override
 *          them through the JSON config file loaded by config::Loader.
 */

#include <cstddef>
#include <cstdint>

namespace relay::config::constants {

// =====================
// Endpoints
// Upstream is where the vehicle (PX4/ArduPilot) sends; the forward port is the
// ground station (QGroundControl) UDP link.
// =====================
inline constexpr const char* UPSTREAM_HOST_DEFAULT = "0.0.0.0";
inline constexpr uint16_t    UPSTREAM_PORT_DEFAULT = 14550;
inline constexpr const char* FORWARD_HOST_DEFAULT  = "127.0.0.1";
inline constexpr uint16_t    FORWARD_PORT_DEFAULT  = 14551;

// =====================
// Log files
// =====================
inline constexpr const char* LOG_DIR_DEFAULT        = "logs";
inline constexpr const char* ARCHIVE_PREFIX_DEFAULT = "mavproxy_log";
inline constexpr const char* JSONL_PREFIX_DEFAULT   = "mavlink_messages";

// =====================
// Queues and flushing
// =====================
inline constexpr std::size_t QUEUE_CAPACITY_DEFAULT      = 1000; ///< Pending frames per path
inline constexpr std::size_t QUEUE_CAPACITY_MAX          = 1000000; ///< Upper bound accepted from config
inline constexpr uint32_t    FLUSH_INTERVAL_MS_DEFAULT   = 1000; ///< Max time between flushes
inline constexpr uint32_t    FLUSH_EVERY_RECORDS_DEFAULT = 100;  ///< Max records between flushes
inline constexpr uint32_t    SHUTDOWN_GRACE_MS_DEFAULT   = 2000; ///< Drain budget on shutdown
inline constexpr uint32_t    STATS_INTERVAL_MS_DEFAULT   = 10000; ///< 0 disables periodic stats
inline constexpr uint32_t    WORKER_POLL_MS              = 50;   ///< Worker idle wake-up period

// =====================
// Ingress
// =====================
inline constexpr uint32_t    INGRESS_RECV_TIMEOUT_MS_DEFAULT  = 200;  ///< Receive timeout (shutdown latency)
inline constexpr uint32_t    INGRESS_MAX_CONSEC_ERRORS        = 3;    ///< Failures before upstream is unreachable
inline constexpr uint32_t    INGRESS_ERROR_WINDOW_MS_DEFAULT  = 1000; ///< Window the failures must fall into
inline constexpr std::size_t INGRESS_MAX_DATAGRAM_DEFAULT     = 2048; ///< Receive buffer per datagram
inline constexpr std::size_t INGRESS_MAX_DATAGRAM_MAX         = 65535; ///< Largest UDP datagram

// =====================
// Publisher
// =====================
inline constexpr uint64_t PUBLISH_ERROR_LOG_EVERY = 100; ///< Log 1st failure then every Nth per endpoint

// =====================
// Logging
// =====================
inline constexpr const char* LOG_LEVEL_DEFAULT = "info";

} // namespace relay::config::constants
