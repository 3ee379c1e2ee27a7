/**
* @file config_loader.cpp
 * @brief JSON config parsing (nlohmann::json) over named defaults.
 */
#include "relay/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace relay::config {
    using json = nlohmann::json;

    namespace {

        /// Copy j[key] into out when present; wrong types throw json::type_error.
        /// Integers outside T's range (negatives for unsigned T) throw std::out_of_range.
        template <class T>
        void read_opt(const json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
                if (it->is_number_unsigned() &&
                    it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    throw std::out_of_range(std::string(key) + " out of range");
                }
                const auto v = it->get<int64_t>();
                if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                    (v > 0 && static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<T>::max()))) {
                    throw std::out_of_range(std::string(key) + " out of range");
                }
                out = static_cast<T>(v);
            } else {
                out = it->get<T>();
            }
        }

        uint16_t read_port(const json& j, const char* where) {
            const auto v = j.at("port").get<int64_t>();
            if (v < 0 || v > std::numeric_limits<uint16_t>::max()) {
                throw std::out_of_range(std::string(where) + ".port out of range");
            }
            return static_cast<uint16_t>(v);
        }

        EndpointConfig read_endpoint(const json& j, const char* where, const EndpointConfig& fallback) {
            EndpointConfig ep = fallback;
            read_opt(j, "host", ep.host);
            if (j.contains("port")) ep.port = read_port(j, where);
            return ep;
        }

        void read_placement(const json& j, const char* key, ThreadPlacement& out) {
            auto it = j.find(key);
            if (it == j.end()) return;
            read_opt(*it, "cpu", out.cpu);
            read_opt(*it, "priority", out.priority);
        }

    } // namespace

    RelayConfig Loader::defaults() {
        return RelayConfig{};
    }

    relay_detail::expected<RelayConfig, ConfigError> Loader::load_from_string(std::string_view text) {
        const json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) return relay_detail::unexpected(ConfigError{"config is not valid JSON"});
        if (!doc.is_object())   return relay_detail::unexpected(ConfigError{"config root must be an object"});

        RelayConfig rc = defaults();
        try {
            if (doc.contains("upstream")) rc.upstream = read_endpoint(doc.at("upstream"), "upstream", rc.upstream);
            if (doc.contains("forward")) {
                rc.forward.clear();
                for (const auto& ep : doc.at("forward")) {
                    rc.forward.push_back(read_endpoint(ep, "forward",
                                                       EndpointConfig{constants::FORWARD_HOST_DEFAULT, 0}));
                }
            }
            read_opt(doc, "log_dir", rc.log_dir);
            read_opt(doc, "archive_prefix", rc.archive_prefix);
            read_opt(doc, "jsonl_prefix", rc.jsonl_prefix);
            read_opt(doc, "queue_capacity", rc.queue_capacity);
            read_opt(doc, "flush_interval_ms", rc.flush_interval_ms);
            read_opt(doc, "flush_every_records", rc.flush_every_records);
            read_opt(doc, "shutdown_grace_ms", rc.shutdown_grace_ms);
            read_opt(doc, "stats_interval_ms", rc.stats_interval_ms);
            read_opt(doc, "strict_decode", rc.strict_decode);
            read_opt(doc, "log_level", rc.log_level);

            if (auto it = doc.find("ingress"); it != doc.end()) {
                read_opt(*it, "recv_timeout_ms", rc.ingress.recv_timeout_ms);
                read_opt(*it, "max_consecutive_errors", rc.ingress.max_consecutive_errors);
                read_opt(*it, "error_window_ms", rc.ingress.error_window_ms);
                read_opt(*it, "max_datagram_bytes", rc.ingress.max_datagram_bytes);
            }
            if (auto it = doc.find("threads"); it != doc.end()) {
                read_placement(*it, "ingress", rc.threads.ingress);
                read_placement(*it, "publish", rc.threads.publish);
                read_placement(*it, "archive", rc.threads.archive);
                read_placement(*it, "jsonl",   rc.threads.jsonl);
            }
        } catch (const json::exception& e) {
            return relay_detail::unexpected(ConfigError{std::string("config type error: ") + e.what()});
        } catch (const std::out_of_range& e) {
            return relay_detail::unexpected(ConfigError{e.what()});
        }

        if (auto err = validate(rc)) return relay_detail::unexpected(*err);
        return rc;
    }

    relay_detail::expected<RelayConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return relay_detail::unexpected(ConfigError{"cannot open config file: " + path});
        std::ostringstream ss;
        ss << in.rdbuf();
        auto rc = load_from_string(ss.str());
        if (!rc) return relay_detail::unexpected(ConfigError{path + ": " + rc.error().message});
        return rc;
    }

    std::optional<ConfigError> Loader::validate(const RelayConfig& cfg) {
        if (cfg.upstream.host.empty())         return ConfigError{"upstream.host is empty"};
        if (cfg.upstream.port == 0)            return ConfigError{"upstream.port must be 1-65535"};
        if (cfg.forward.empty())               return ConfigError{"forward must list at least one endpoint"};
        for (const auto& ep : cfg.forward) {
            if (ep.host.empty())               return ConfigError{"forward host is empty"};
            if (ep.port == 0)                  return ConfigError{"forward port must be 1-65535"};
        }
        if (cfg.log_dir.empty())               return ConfigError{"log_dir is empty"};
        if (cfg.queue_capacity == 0 || cfg.queue_capacity > constants::QUEUE_CAPACITY_MAX)
                                               return ConfigError{"queue_capacity must be 1-" +
                                                                  std::to_string(constants::QUEUE_CAPACITY_MAX)};
        if (cfg.flush_interval_ms == 0)        return ConfigError{"flush_interval_ms must be > 0"};
        if (cfg.flush_every_records == 0)      return ConfigError{"flush_every_records must be > 0"};
        if (cfg.ingress.recv_timeout_ms == 0)  return ConfigError{"ingress.recv_timeout_ms must be > 0"};
        if (cfg.ingress.max_consecutive_errors == 0)
                                               return ConfigError{"ingress.max_consecutive_errors must be > 0"};
        if (cfg.ingress.error_window_ms == 0)  return ConfigError{"ingress.error_window_ms must be > 0"};
        if (cfg.ingress.max_datagram_bytes == 0 ||
            cfg.ingress.max_datagram_bytes > constants::INGRESS_MAX_DATAGRAM_MAX)
                                               return ConfigError{"ingress.max_datagram_bytes must be 1-" +
                                                                  std::to_string(constants::INGRESS_MAX_DATAGRAM_MAX)};
        return std::nullopt;
    }

} // namespace relay::config
