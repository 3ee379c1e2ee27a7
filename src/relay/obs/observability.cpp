/**
* @file observability.cpp
 * @brief Snapshot and spdlog reporting of relay counters.
 */
#include "relay/obs/observability.hpp"
#include "relay/obs/log.hpp"

namespace relay::obs {

    RelaySnapshot snapshot(const RelayCounters& c) noexcept {
        RelaySnapshot s;
        s.frames         = c.ingress.frames.load(std::memory_order_relaxed);
        s.bytes          = c.ingress.bytes.load(std::memory_order_relaxed);
        s.ingress_errors = c.ingress.errors.load(std::memory_order_relaxed);
        for (auto p : pipeline::kAllPaths) {
            const auto& src = c.path(p);
            auto& dst = s.paths[pipeline::index_of(p)];
            dst.enqueued  = src.enqueued.load(std::memory_order_relaxed);
            dst.dropped   = src.dropped.load(std::memory_order_relaxed);
            dst.rejected  = src.rejected.load(std::memory_order_relaxed);
            dst.processed = src.processed.load(std::memory_order_relaxed);
            dst.failed    = src.failed.load(std::memory_order_relaxed);
            dst.discarded = src.discarded.load(std::memory_order_relaxed);
        }
        return s;
    }

    void log_snapshot(const RelaySnapshot& s, std::string_view label) {
        auto& lg = log();
        lg.info("{}: ingress frames={} bytes={} errors={}", label, s.frames, s.bytes, s.ingress_errors);
        for (auto p : pipeline::kAllPaths) {
            const auto& ps = s.path(p);
            lg.info("{}: path={} enqueued={} processed={} dropped={} rejected={} failed={} discarded={}",
                    label, pipeline::to_string(p), ps.enqueued, ps.processed, ps.dropped,
                    ps.rejected, ps.failed, ps.discarded);
        }
    }

} // namespace relay::obs
