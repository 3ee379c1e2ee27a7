/**
 * @file endpoint.cpp
 * @brief IPv4 endpoint resolution.
 */
#include "relay/net/endpoint.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <cstring>

namespace relay::net {

NetError make_net_error(const std::string& what, int code) {
    return NetError{code, what + ": " + std::strerror(code)};
}

relay_detail::expected<Endpoint, NetError> Endpoint::resolve(const std::string& host, uint16_t port) {
    Endpoint ep;
    ep.host_ = host;
    ep.port_ = port;
    ep.addr_.sin_family = AF_INET;
    ep.addr_.sin_port   = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &ep.addr_.sin_addr) == 1) return ep;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr) {
        return relay_detail::unexpected(NetError{rc, "cannot resolve '" + host + "': " + gai_strerror(rc)});
    }
    ep.addr_.sin_addr = reinterpret_cast<const sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return ep;
}

Endpoint Endpoint::from_sockaddr(const sockaddr_in& sa) {
    Endpoint ep;
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &sa.sin_addr, buf, sizeof(buf));
    ep.host_ = buf;
    ep.port_ = ntohs(sa.sin_port);
    ep.addr_ = sa;
    return ep;
}

std::string Endpoint::to_string() const {
    return host_ + ":" + std::to_string(port_);
}

} // namespace relay::net
