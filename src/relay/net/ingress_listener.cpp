/**
 * @file ingress_listener.cpp
 * @brief Ingress failure policy.
 */
#include "relay/net/ingress_listener.hpp"

#include "relay/obs/log.hpp"

namespace relay::net {

IngressListener::IngressListener(std::unique_ptr<FrameSource> source, IngressPolicy policy,
                                 obs::IngressCounters& counters) noexcept
    : source_(std::move(source)), policy_(policy), counters_(counters) {}

relay_detail::expected<std::optional<mem::RawFrame>, IngressFault> IngressListener::next() {
    auto r = source_->receive();
    if (r) {
        if (r->has_value()) {
            streak_ = 0;
            counters_.frames.fetch_add(1, std::memory_order_relaxed);
            counters_.bytes.fetch_add((*r)->bytes.size(), std::memory_order_relaxed);
        }
        return std::move(*r);
    }

    counters_.errors.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::steady_clock::now();
    if (streak_ == 0 || now - streak_start_ > policy_.error_window) {
        streak_ = 1;
        streak_start_ = now;
    } else {
        ++streak_;
    }

    obs::log().warn("ingress: receive failed on {} ({}), consecutive={}/{}",
                    source_->describe(), r.error().message, streak_, policy_.max_consecutive_errors);

    if (streak_ >= policy_.max_consecutive_errors) {
        obs::log().critical("ingress: upstream {} unreachable after {} consecutive failures within {} ms",
                            source_->describe(), streak_, policy_.error_window.count());
        return relay_detail::unexpected(IngressFault::UpstreamUnreachable);
    }
    return std::optional<mem::RawFrame>{};
}

} // namespace relay::net
