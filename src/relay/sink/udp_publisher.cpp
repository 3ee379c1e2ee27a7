/**
 * @file udp_publisher.cpp
 * @brief Downstream UDP fan-out.
 */
#include "relay/sink/udp_publisher.hpp"

#include <cstring>

#include "relay/config/constants.hpp"
#include "relay/obs/log.hpp"

namespace relay::sink {

relay_detail::expected<std::unique_ptr<UdpPublisher>, OpenError>
UdpPublisher::open(const std::vector<config::EndpointConfig>& endpoints) {
    std::vector<net::Endpoint> resolved;
    resolved.reserve(endpoints.size());
    for (const auto& ep : endpoints) {
        auto r = net::Endpoint::resolve(ep.host, ep.port);
        if (!r) return relay_detail::unexpected(OpenError{"forward endpoint: " + r.error().message});
        resolved.push_back(std::move(*r));
    }
    return open(std::move(resolved));
}

relay_detail::expected<std::unique_ptr<UdpPublisher>, OpenError>
UdpPublisher::open(std::vector<net::Endpoint> endpoints) {
    if (endpoints.empty()) return relay_detail::unexpected(OpenError{"no forward endpoints"});
    auto sock = net::UdpSocket::open();
    if (!sock) return relay_detail::unexpected(OpenError{"publisher socket: " + sock.error().message});
    return std::unique_ptr<UdpPublisher>(new UdpPublisher(std::move(*sock), std::move(endpoints)));
}

UdpPublisher::UdpPublisher(net::UdpSocket sock, std::vector<net::Endpoint> endpoints)
    : sock_(std::move(sock)), endpoints_(std::move(endpoints)) {
    stats_.reserve(endpoints_.size());
    for (std::size_t i = 0; i < endpoints_.size(); ++i) stats_.push_back(std::make_unique<EndpointStats>());
}

std::string UdpPublisher::describe() const {
    std::string s;
    for (const auto& ep : endpoints_) {
        if (!s.empty()) s += ",";
        s += "udp:" + ep.to_string();
    }
    return s;
}

SinkStatus UdpPublisher::write(const mem::RawFrame& frame) {
    for (std::size_t i = 0; i < endpoints_.size(); ++i) {
        auto& st = *stats_[i];
        const int err = sock_.send_to(frame.bytes, endpoints_[i]);
        if (err == 0) {
            st.sent.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        const auto n = st.failed.fetch_add(1, std::memory_order_relaxed);
        st.last_error.store(err, std::memory_order_relaxed);
        if (n % config::constants::PUBLISH_ERROR_LOG_EVERY == 0) {
            obs::log().warn("publish: send to {} failed: {} (failures={})",
                            endpoints_[i].to_string(), std::strerror(err), n + 1);
        }
    }
    return SinkStatus::Ok;
}

void UdpPublisher::close() noexcept {
    sock_ = net::UdpSocket{};
}

} // namespace relay::sink
