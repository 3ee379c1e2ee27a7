#pragma once
/**
 * @file relay.hpp
 * @brief Relay orchestrator: ingress listener -> fan-out router -> three sink workers.
 *
 * Threads:
 *  - ingress: the thread calling run(); receives, stamps and dispatches.
 *  - relay-publish / relay-archive / relay-jsonl: one SinkWorker each.
 *
 * The ingress thread never blocks on a sink. A slow or failed path only loses
 * its own frames (dropped on overflow, rejected after fail-stop).
 */

#include <array>
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "relay/compat/expected.hpp"
#include "relay/config/config_loader.hpp"
#include "relay/net/frame_source.hpp"
#include "relay/net/ingress_listener.hpp"
#include "relay/obs/observability.hpp"
#include "relay/pipeline/fanout_router.hpp"
#include "relay/pipeline/path.hpp"
#include "relay/pipeline/sink_worker.hpp"
#include "relay/sink/frame_sink.hpp"

namespace relay::pipeline {

/** @struct RelayError
 *  @brief Setup failure (bad directory, unopenable file, unbindable socket, ...).
 */
struct RelayError {
    std::string message;
};

/// @brief Why run() returned.
enum class RunOutcome : std::uint8_t {
    Stopped = 0,          ///< Stop flag observed
    UpstreamUnreachable   ///< Ingress failure policy tripped
};

constexpr const char* to_string(RunOutcome o) noexcept {
    return o == RunOutcome::Stopped ? "stopped" : "upstream_unreachable";
}

class Relay {
public:
    /// One sink per path, indexed by index_of(Path).
    using Sinks = std::array<std::unique_ptr<sink::FrameSink>, kPathCount>;

    /**
     * @brief Production wiring: create log_dir, open the .tlog/.jsonl files,
     *        the downstream publisher and the upstream UDP socket.
     */
    static relay_detail::expected<std::unique_ptr<Relay>, RelayError>
    create(const config::RelayConfig& cfg);

    /**
     * @brief Wire a relay from already built parts.
     * @param cfg Queue, flush, ingress and thread settings.
     * @param source Upstream frame source.
     * @param sinks Publish, archive and JSONL sinks (none may be null).
     */
    static relay_detail::expected<std::unique_ptr<Relay>, RelayError>
    assemble(const config::RelayConfig& cfg, std::unique_ptr<net::FrameSource> source, Sinks sinks);

    ~Relay();

    Relay(const Relay&)            = delete;
    Relay& operator=(const Relay&) = delete;

    /**
     * @brief Start the workers and run the ingress loop on the calling thread.
     * @param stop Checked between receives (bounded by the receive timeout).
     */
    RunOutcome run(const std::atomic<bool>& stop);

    /**
     * @brief Close the queues, drain within the shutdown grace, join workers.
     * @details Idempotent; also called by the destructor.
     */
    void shutdown();

    obs::RelaySnapshot snapshot() const noexcept { return obs::snapshot(counters_); }

    /// True once the sink of @p p fail-stopped.
    bool path_failed(Path p) const noexcept { return workers_[index_of(p)]->failed(); }

    /// Archive/JSONL files opened by create() (empty when assembled).
    const std::filesystem::path& archive_path() const noexcept { return archive_path_; }
    const std::filesystem::path& jsonl_path() const noexcept { return jsonl_path_; }

private:
    explicit Relay(const config::RelayConfig& cfg);

    config::RelayConfig                                  cfg_;
    obs::RelayCounters                                   counters_;
    std::optional<FanOutRouter>                          router_;
    std::optional<net::IngressListener>                  listener_;
    std::array<std::unique_ptr<SinkWorker>, kPathCount>  workers_;
    std::filesystem::path                                archive_path_;
    std::filesystem::path                                jsonl_path_;
    bool                                                 started_{false};
    bool                                                 shut_down_{false};
};

} // namespace relay::pipeline
