/**
 * @file frame_source.cpp
 * @brief UDP-backed frame source.
 */
#include "relay/net/frame_source.hpp"

#include <cerrno>
#include <new>
#include <stdexcept>

#include "relay/obs/log.hpp"

namespace relay::net {

    relay_detail::expected<std::unique_ptr<UdpFrameSource>, NetError>
    UdpFrameSource::open(const config::EndpointConfig& upstream, const config::IngressConfig& ingress) {
        auto ep = Endpoint::resolve(upstream.host, upstream.port);
        if (!ep) return relay_detail::unexpected(ep.error());

        auto sock = UdpSocket::bind(*ep);
        if (!sock) return relay_detail::unexpected(sock.error());

        if (!sock->set_recv_timeout(std::chrono::milliseconds(ingress.recv_timeout_ms))) {
            return relay_detail::unexpected(make_net_error("SO_RCVTIMEO", errno));
        }
        auto local = sock->local_endpoint();
        if (!local) return relay_detail::unexpected(local.error());

        try {
            return std::unique_ptr<UdpFrameSource>(
                new UdpFrameSource(std::move(*sock), std::move(*local), ingress.max_datagram_bytes));
        } catch (const std::bad_alloc&) {
            return relay_detail::unexpected(make_net_error("receive buffer", ENOMEM));
        } catch (const std::length_error&) {
            return relay_detail::unexpected(make_net_error("receive buffer", ENOMEM));
        }
    }

    UdpFrameSource::UdpFrameSource(UdpSocket sock, Endpoint local, std::size_t max_datagram)
        : sock_(std::move(sock)), local_(std::move(local)), buffer_(max_datagram) {}

    ReceiveResult UdpFrameSource::receive() {
        const auto r = sock_.receive(buffer_);
        switch (r.status) {
            case RecvStatus::Timeout:
                return std::optional<mem::RawFrame>{};
            case RecvStatus::Error:
                return relay_detail::unexpected(make_net_error("recv on " + local_.to_string(), r.error));
            case RecvStatus::Ok:
                break;
        }
        if (r.truncated && truncated_++ == 0) {
            obs::log().warn("ingress: datagram larger than {} bytes truncated (raise ingress.max_datagram_bytes)",
                            buffer_.size());
        }
        mem::RawFrame f;
        f.bytes.assign(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(r.size));
        f.timestamp_us = clock_.now_us();
        f.direction    = mem::Direction::Rx;
        return std::optional<mem::RawFrame>{std::move(f)};
    }

    std::string UdpFrameSource::describe() const {
        return "udp:" + local_.to_string();
    }

} // namespace relay::net
