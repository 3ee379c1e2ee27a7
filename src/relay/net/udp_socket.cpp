/**
 * @file udp_socket.cpp
 * @brief POSIX UDP socket wrapper.
 */
#include "relay/net/udp_socket.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace relay::net {

relay_detail::expected<UdpSocket, NetError> UdpSocket::open() {
    const int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return relay_detail::unexpected(make_net_error("socket", errno));
    return UdpSocket(fd);
}

relay_detail::expected<UdpSocket, NetError> UdpSocket::bind(const Endpoint& local) {
    auto sock = open();
    if (!sock) return sock;

    int yes = 1;
    ::setsockopt(sock->fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    const auto& sa = local.addr();
    if (::bind(sock->fd_, reinterpret_cast<const sockaddr*>(&sa), sizeof(sa)) != 0) {
        return relay_detail::unexpected(make_net_error("bind " + local.to_string(), errno));
    }
    return sock;
}

UdpSocket::~UdpSocket() { reset(); }

UdpSocket::UdpSocket(UdpSocket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void UdpSocket::reset() noexcept {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

bool UdpSocket::set_recv_timeout(std::chrono::milliseconds timeout) noexcept {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

RecvOutcome UdpSocket::receive(std::span<std::uint8_t> buf) noexcept {
    RecvOutcome out;
    // MSG_TRUNC makes recv report the full datagram length even if it did not fit.
    const ssize_t n = ::recv(fd_, buf.data(), buf.size(), MSG_TRUNC);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            out.status = RecvStatus::Timeout;
        } else {
            out.status = RecvStatus::Error;
            out.error  = errno;
        }
        return out;
    }
    out.status    = RecvStatus::Ok;
    out.truncated = static_cast<std::size_t>(n) > buf.size();
    out.size      = out.truncated ? buf.size() : static_cast<std::size_t>(n);
    return out;
}

int UdpSocket::send_to(std::span<const std::uint8_t> bytes, const Endpoint& to) noexcept {
    const auto& sa = to.addr();
    const ssize_t n = ::sendto(fd_, bytes.data(), bytes.size(), MSG_DONTWAIT | MSG_NOSIGNAL,
                               reinterpret_cast<const sockaddr*>(&sa), sizeof(sa));
    if (n < 0) return errno;
    return 0;
}

relay_detail::expected<Endpoint, NetError> UdpSocket::local_endpoint() const {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&sa), &len) != 0) {
        return relay_detail::unexpected(make_net_error("getsockname", errno));
    }
    return Endpoint::from_sockaddr(sa);
}

} // namespace relay::net
