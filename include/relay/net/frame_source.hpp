#pragma once
/**
 * @file frame_source.hpp
 * @brief Pluggable upstream: where the ingress listener gets its frames from.
 * @details UdpFrameSource in production; tests script their own sources.
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "relay/compat/expected.hpp"
#include "relay/config/config_loader.hpp"
#include "relay/mem/raw_frame.hpp"
#include "relay/net/endpoint.hpp"
#include "relay/net/udp_socket.hpp"

namespace relay::net {

    /// Frame, nothing-yet (timeout), or a transport error.
    using ReceiveResult = relay_detail::expected<std::optional<mem::RawFrame>, NetError>;

    class FrameSource {
    public:
        virtual ~FrameSource() = default;

        /**
         * @brief Wait a bounded time for the next frame.
         * @return A stamped RawFrame, std::nullopt on timeout, or NetError.
         */
        virtual ReceiveResult receive() = 0;

        /// Human-readable description for logs (e.g. "udp:0.0.0.0:14550").
        virtual std::string describe() const = 0;
    };

    /**
     * @class UdpFrameSource
     * @brief Bound UDP socket; one datagram becomes one RawFrame.
     */
    class UdpFrameSource final : public FrameSource {
    public:
        /**
         * @brief Bind the upstream endpoint.
         * @param upstream Address/port to listen on.
         * @param ingress Receive timeout and buffer size.
         */
        static relay_detail::expected<std::unique_ptr<UdpFrameSource>, NetError>
        open(const config::EndpointConfig& upstream, const config::IngressConfig& ingress);

        ReceiveResult receive() override;
        std::string describe() const override;

        /// Actual bound endpoint (resolves an ephemeral port).
        const Endpoint& local() const noexcept { return local_; }

    private:
        UdpFrameSource(UdpSocket sock, Endpoint local, std::size_t max_datagram);

        UdpSocket                 sock_;
        Endpoint                  local_;
        std::vector<std::uint8_t> buffer_;
        mem::MonotonicWallClock   clock_;
        uint64_t                  truncated_{0};
    };

} // namespace relay::net
