#pragma once
/**
 * @file udp_publisher.hpp
 * @brief Downstream publisher: forward each frame, unmodified, to every endpoint.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "relay/compat/expected.hpp"
#include "relay/config/config_loader.hpp"
#include "relay/net/endpoint.hpp"
#include "relay/net/udp_socket.hpp"
#include "relay/sink/frame_sink.hpp"

namespace relay::sink {

/** @struct EndpointStats
 *  @brief Per-endpoint send accounting (readable from any thread).
 */
struct EndpointStats {
    std::atomic<std::uint64_t> sent{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<int>           last_error{0};
};

/**
 * @class UdpPublisher
 * @brief Fire-and-forget fan-out over one unbound UDP socket.
 *
 * A failed send is counted and logged (first failure, then every Nth per
 * endpoint); it never stops the other endpoints or later frames, and it is
 * never retried. write() therefore always reports Ok.
 */
class UdpPublisher final : public FrameSink {
public:
    /// @brief Resolve @p endpoints and open the sending socket.
    static relay_detail::expected<std::unique_ptr<UdpPublisher>, OpenError>
    open(const std::vector<config::EndpointConfig>& endpoints);

    /// @brief Same, from already resolved endpoints.
    static relay_detail::expected<std::unique_ptr<UdpPublisher>, OpenError>
    open(std::vector<net::Endpoint> endpoints);

    std::string describe() const override;
    SinkStatus write(const mem::RawFrame& frame) override;
    SinkStatus flush() override { return SinkStatus::Ok; }
    void close() noexcept override;

    std::size_t endpoint_count() const noexcept { return endpoints_.size(); }
    const net::Endpoint& endpoint(std::size_t i) const noexcept { return endpoints_[i]; }
    const EndpointStats& stats(std::size_t i) const noexcept { return *stats_[i]; }

private:
    UdpPublisher(net::UdpSocket sock, std::vector<net::Endpoint> endpoints);

    net::UdpSocket                               sock_;
    std::vector<net::Endpoint>                   endpoints_;
    std::vector<std::unique_ptr<EndpointStats>>  stats_;
};

} // namespace relay::sink
