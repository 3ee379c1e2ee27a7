#pragma once
/**
 * @file endpoint.hpp
 * @brief Resolved IPv4 UDP endpoint (immutable after resolution).
 */

#include <cstdint>
#include <string>

#include <netinet/in.h>

#include "relay/compat/expected.hpp"

namespace relay::net {

/** @struct NetError
 *  @brief errno plus context for socket/transport failures.
 */
struct NetError {
    int         code{0};   ///< errno (or getaddrinfo code for resolution failures)
    std::string message;   ///< Human-readable context
};

/// "<what>: <strerror(code)>"
NetError make_net_error(const std::string& what, int code);

/**
 * @class Endpoint
 * @brief host:port resolved once into a sockaddr_in.
 */
class Endpoint {
public:
    /**
     * @brief Resolve an IPv4 literal or host name.
     * @return Endpoint, or NetError if the name does not resolve to IPv4.
     */
    static relay_detail::expected<Endpoint, NetError> resolve(const std::string& host, uint16_t port);

    /// Build from an already filled sockaddr_in (e.g. getsockname()).
    static Endpoint from_sockaddr(const sockaddr_in& sa);

    const std::string& host() const noexcept { return host_; }
    uint16_t           port() const noexcept { return port_; }
    const sockaddr_in& addr() const noexcept { return addr_; }

    /// "host:port"
    std::string to_string() const;

private:
    std::string host_;
    uint16_t    port_{0};
    sockaddr_in addr_{};
};

} // namespace relay::net
