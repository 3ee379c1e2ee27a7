#pragma once
/**
 * @file udp_socket.hpp
 * @brief RAII owner of one IPv4 UDP socket.
 * @details Move-only. The descriptor is closed exactly once, by the last owner.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

#include "relay/compat/expected.hpp"
#include "relay/net/endpoint.hpp"

namespace relay::net {

/// @brief Result class of a receive attempt.
enum class RecvStatus : std::uint8_t {
    Ok = 0,   ///< One datagram received
    Timeout,  ///< Nothing arrived within the receive timeout (or interrupted)
    Error     ///< Transport error, see RecvOutcome::error
};

/// @brief Outcome of UdpSocket::receive.
struct RecvOutcome {
    RecvStatus  status{RecvStatus::Timeout};
    std::size_t size{0};       ///< Bytes stored in the buffer
    bool        truncated{false}; ///< Datagram was larger than the buffer
    int         error{0};      ///< errno when status == Error
};

class UdpSocket {
public:
    /// @brief Unbound socket for sending.
    static relay_detail::expected<UdpSocket, NetError> open();

    /// @brief Socket bound to @p local (port 0 picks an ephemeral port).
    static relay_detail::expected<UdpSocket, NetError> bind(const Endpoint& local);

    UdpSocket() noexcept = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&)            = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    /// @brief Bound the time receive() may block.
    bool set_recv_timeout(std::chrono::milliseconds timeout) noexcept;

    /// @brief Wait for one datagram (up to the receive timeout).
    RecvOutcome receive(std::span<std::uint8_t> buf) noexcept;

    /**
     * @brief Send one datagram without blocking.
     * @return 0 on success, otherwise the errno of the failure.
     */
    int send_to(std::span<const std::uint8_t> bytes, const Endpoint& to) noexcept;

    /// @brief Address the socket is bound to (after bind()).
    relay_detail::expected<Endpoint, NetError> local_endpoint() const;

    int  fd() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

private:
    explicit UdpSocket(int fd) noexcept : fd_(fd) {}
    void reset() noexcept;

    int fd_{-1};
};

} // namespace relay::net
