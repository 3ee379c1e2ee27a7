#pragma once
/**
 * @file config_loader.hpp
 * @brief Relay configuration model and its JSON loader.
 * @details All defaults reference named constants to avoid magic numbers. The
 *          configuration is read once before the pipeline starts and is
 *          immutable afterwards.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "relay/compat/expected.hpp"
#include "relay/config/constants.hpp"

namespace relay::config {

    /** @struct EndpointConfig
     *  @brief host:port pair (IPv4 literal or resolvable name).
     */
    struct EndpointConfig {
        std::string host;
        uint16_t    port{0};
    };

    /** @struct IngressConfig
     *  @brief Upstream receive loop tuning.
     */
    struct IngressConfig {
        uint32_t    recv_timeout_ms{constants::INGRESS_RECV_TIMEOUT_MS_DEFAULT};  ///< Receive poll period
        uint32_t    max_consecutive_errors{constants::INGRESS_MAX_CONSEC_ERRORS}; ///< Failures that mean unreachable
        uint32_t    error_window_ms{constants::INGRESS_ERROR_WINDOW_MS_DEFAULT};  ///< Window for those failures
        std::size_t max_datagram_bytes{constants::INGRESS_MAX_DATAGRAM_DEFAULT};  ///< Receive buffer size
    };

    /** @struct ThreadPlacement
     *  @brief Optional CPU pinning / RT priority of one thread.
     */
    struct ThreadPlacement {
        int cpu{-1};      ///< -1: no pinning
        int priority{0};  ///< 0: default scheduler, otherwise SCHED_FIFO priority
    };

    /** @struct ThreadsConfig
     *  @brief Placement of the ingress thread and the three sink workers.
     */
    struct ThreadsConfig {
        ThreadPlacement ingress;
        ThreadPlacement publish;
        ThreadPlacement archive;
        ThreadPlacement jsonl;
    };

    /** @struct RelayConfig
     *  @brief Aggregate configuration of the relay process.
     */
    struct RelayConfig {
        EndpointConfig              upstream{constants::UPSTREAM_HOST_DEFAULT, constants::UPSTREAM_PORT_DEFAULT};
        std::vector<EndpointConfig> forward{EndpointConfig{constants::FORWARD_HOST_DEFAULT, constants::FORWARD_PORT_DEFAULT}};
        std::string                 log_dir{constants::LOG_DIR_DEFAULT};
        std::string                 archive_prefix{constants::ARCHIVE_PREFIX_DEFAULT};
        std::string                 jsonl_prefix{constants::JSONL_PREFIX_DEFAULT};
        std::size_t                 queue_capacity{constants::QUEUE_CAPACITY_DEFAULT};
        uint32_t                    flush_interval_ms{constants::FLUSH_INTERVAL_MS_DEFAULT};
        uint32_t                    flush_every_records{constants::FLUSH_EVERY_RECORDS_DEFAULT};
        uint32_t                    shutdown_grace_ms{constants::SHUTDOWN_GRACE_MS_DEFAULT};
        uint32_t                    stats_interval_ms{constants::STATS_INTERVAL_MS_DEFAULT};
        bool                        strict_decode{false};
        std::string                 log_level{constants::LOG_LEVEL_DEFAULT};
        IngressConfig               ingress;
        ThreadsConfig               threads;
    };

    /** @struct ConfigError
     *  @brief Human-readable reason a configuration was rejected.
     */
    struct ConfigError {
        std::string message;
    };

    /** @class Loader
     *  @brief Source of relay configuration (defaults or parsed JSON).
     */
    class Loader {
    public:
        /// @return Configuration made only of named defaults.
        static RelayConfig defaults();

        /**
         * @brief Parse a JSON document; keys that are absent keep their defaults.
         * @param text JSON object text.
         * @return Validated RelayConfig, or the first problem found.
         */
        static relay_detail::expected<RelayConfig, ConfigError> load_from_string(std::string_view text);

        /**
         * @brief Read and parse a JSON config file.
         * @param path File path.
         * @return Validated RelayConfig, or why it could not be loaded.
         */
        static relay_detail::expected<RelayConfig, ConfigError> load_from_file(const std::string& path);

        /// @return std::nullopt if @p cfg is usable, otherwise the first violation.
        static std::optional<ConfigError> validate(const RelayConfig& cfg);
    };

} // namespace relay::config
