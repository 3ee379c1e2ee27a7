/**
 * @file relay.cpp
 * @brief Relay setup, ingress loop and orderly shutdown.
 */
#include "relay/pipeline/relay.hpp"

#include <chrono>
#include <system_error>

#include "relay/obs/log.hpp"
#include "relay/os/rt.hpp"
#include "relay/sink/archive_writer.hpp"
#include "relay/sink/jsonl_writer.hpp"
#include "relay/sink/log_record.hpp"
#include "relay/sink/udp_publisher.hpp"

namespace relay::pipeline {

namespace {

const char* describe(mem::QueueError e) noexcept {
    switch (e) {
        case mem::QueueError::CapacityZero:             return "queue capacity must be > 0";
        case mem::QueueError::AllocationFailed:         return "queue allocation failed";
        case mem::QueueError::ElementNotNothrowMovable: return "queue element not nothrow-movable";
    }
    return "queue error";
}

const config::ThreadPlacement& placement(const config::ThreadsConfig& t, Path p) noexcept {
    switch (p) {
        case Path::Publish: return t.publish;
        case Path::Archive: return t.archive;
        case Path::Jsonl:   return t.jsonl;
    }
    return t.publish;
}

os::RtConfig rt_config(std::string name, const config::ThreadPlacement& tp) {
    return os::RtConfig{std::move(name), tp.cpu, os::RtSchedPolicy::Fifo, tp.priority};
}

relay_detail::unexpected<RelayError> fail(std::string msg) {
    return relay_detail::unexpected<RelayError>(RelayError{std::move(msg)});
}

} // namespace

Relay::Relay(const config::RelayConfig& cfg) : cfg_(cfg) {}

Relay::~Relay() { shutdown(); }

relay_detail::expected<std::unique_ptr<Relay>, RelayError>
Relay::create(const config::RelayConfig& cfg) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.log_dir, ec);
    if (ec) return fail("cannot create log directory " + cfg.log_dir + ": " + ec.message());

    // Sockets first so a bind failure leaves no empty log files behind.
    auto source = net::UdpFrameSource::open(cfg.upstream, cfg.ingress);
    if (!source) return fail("upstream: " + source.error().message);
    auto publisher = sink::UdpPublisher::open(cfg.forward);
    if (!publisher) return fail(publisher.error().message);

    const auto started = std::chrono::system_clock::now();
    const auto tlog  = sink::unused_path(sink::timestamped_path(cfg.log_dir, cfg.archive_prefix, ".tlog", started));
    const auto jsonl = sink::unused_path(sink::timestamped_path(cfg.log_dir, cfg.jsonl_prefix, ".jsonl", started));

    auto archive = sink::ArchiveWriter::open(tlog);
    if (!archive) return fail(archive.error().message);
    auto jsonlog = sink::JsonlWriter::open(jsonl, proto::DecodeOptions{cfg.strict_decode});
    if (!jsonlog) return fail(jsonlog.error().message);

    Sinks sinks;
    sinks[index_of(Path::Publish)] = std::move(*publisher);
    sinks[index_of(Path::Archive)] = std::move(*archive);
    sinks[index_of(Path::Jsonl)]   = std::move(*jsonlog);

    auto relay = assemble(cfg, std::move(*source), std::move(sinks));
    if (!relay) return relay;
    (*relay)->archive_path_ = tlog;
    (*relay)->jsonl_path_   = jsonl;
    return relay;
}

relay_detail::expected<std::unique_ptr<Relay>, RelayError>
Relay::assemble(const config::RelayConfig& cfg, std::unique_ptr<net::FrameSource> source, Sinks sinks) {
    if (!source) return fail("no frame source");
    for (auto p : kAllPaths) {
        if (!sinks[index_of(p)]) return fail(std::string("no sink for path ") + to_string(p));
    }

    std::unique_ptr<Relay> relay(new Relay(cfg));

    auto router = FanOutRouter::create(cfg.queue_capacity, relay->counters_);
    if (!router) return fail(describe(router.error()));
    relay->router_.emplace(std::move(*router));

    const net::IngressPolicy policy{cfg.ingress.max_consecutive_errors,
                                    std::chrono::milliseconds(cfg.ingress.error_window_ms)};
    relay->listener_.emplace(std::move(source), policy, relay->counters_.ingress);

    const FlushPolicy flush{std::chrono::milliseconds(cfg.flush_interval_ms), cfg.flush_every_records};
    for (auto p : kAllPaths) {
        const auto i = index_of(p);
        relay->workers_[i] = std::make_unique<SinkWorker>(
            p, relay->router_->queue(p), std::move(sinks[i]), flush, relay->counters_.path(p),
            rt_config(std::string("relay-") + to_string(p), placement(cfg.threads, p)));
    }
    return relay;
}

RunOutcome Relay::run(const std::atomic<bool>& stop) {
    auto& lg = obs::log();
    if (shut_down_) return RunOutcome::Stopped;
    if (!started_) {
        for (auto& w : workers_) w->start();
        started_ = true;
    }

    if (!os::bind_and_prioritize(rt_config("relay-ingress", cfg_.threads.ingress))) {
        lg.debug("ingress: thread placement not fully applied");
    }
    lg.info("ingress: listening on {}", listener_->describe());

    using clock = std::chrono::steady_clock;
    const std::chrono::milliseconds stats_every{cfg_.stats_interval_ms};
    auto next_stats = clock::now() + stats_every;

    RunOutcome outcome = RunOutcome::Stopped;
    while (!stop.load(std::memory_order_acquire)) {
        auto r = listener_->next();
        if (!r) {
            outcome = RunOutcome::UpstreamUnreachable;
            break;
        }
        if (r->has_value()) router_->dispatch(std::move(**r));

        if (stats_every.count() > 0 && clock::now() >= next_stats) {
            obs::log_snapshot(snapshot(), "stats");
            next_stats = clock::now() + stats_every;
        }
    }
    lg.info("ingress: loop ended ({})", to_string(outcome));
    return outcome;
}

void Relay::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    const auto deadline = SinkWorker::clock::now() + std::chrono::milliseconds(cfg_.shutdown_grace_ms);
    if (router_) router_->close_all();
    for (auto& w : workers_) {
        if (w) w->request_stop(deadline);
    }
    for (auto& w : workers_) {
        if (w) w->join();
    }
    obs::log_snapshot(snapshot(), "final");
}

} // namespace relay::pipeline
