// apps/frame_gen/src/main.cpp
// telemetry-relay: frame_gen
// Purpose: Standalone helper that plays a vehicle: sends MAVLink v2 HEARTBEAT
// frames to a relay's upstream port. This is NOT the relay, it is a testing utility.
//
// Usage:
//   ./frame_gen <host> <port> [count] [rate_hz]
//
// Notes:
// - Sequence numbers wrap at 256 like a real autopilot.
// - Pair with relay_app and watch the .jsonl log fill up.

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "relay/net/endpoint.hpp"
#include "relay/net/udp_socket.hpp"
#include "relay/proto/catalogue.hpp"
#include "relay/proto/encoder.hpp"

static int send_heartbeats(const relay::net::Endpoint& to, int count, int rate_hz) {
    auto sock = relay::net::UdpSocket::open();
    if (!sock) {
        std::cerr << "socket: " << sock.error().message << std::endl;
        return 1;
    }

    const auto* spec = relay::proto::find_message("HEARTBEAT");
    const auto period = std::chrono::microseconds(1'000'000 / rate_hz);
    const auto payload = relay::proto::heartbeat_payload(relay::proto::Heartbeat{});

    int failures = 0;
    auto next = std::chrono::steady_clock::now();
    for (int i = 0; i < count; ++i) {
        relay::proto::FrameFields h;
        h.seq = static_cast<std::uint8_t>(i & 0xFF);
        const auto frame = relay::proto::encode_v2(*spec, h, payload);

        if (const int err = sock->send_to(frame, to); err != 0) {
            ++failures;
            std::cerr << "send seq=" << i << " failed: errno " << err << std::endl;
        } else {
            std::cout << "HEARTBEAT -> " << to.to_string()
                      << " seq=" << int(h.seq)
                      << " bytes=" << frame.size()
                      << std::endl;
        }

        next += period;
        std::this_thread::sleep_until(next);
    }
    return failures == count && count > 0 ? 1 : 0;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <host> <port> [count] [rate_hz]" << std::endl;
        return 1;
    }

    int port = 0, count = 10, rate_hz = 1;
    try {
        port    = std::stoi(argv[2]);
        count   = (argc > 3) ? std::stoi(argv[3]) : count;
        rate_hz = (argc > 4) ? std::stoi(argv[4]) : rate_hz;
    } catch (const std::exception& e) {
        std::cerr << "invalid number: " << e.what() << std::endl;
        return 1;
    }
    if (port <= 0 || port > 65535 || count < 0 || rate_hz <= 0 || rate_hz > 1'000'000) {
        std::cerr << "out of range: port 1..65535, count >= 0, rate_hz 1..1000000" << std::endl;
        return 1;
    }

    auto to = relay::net::Endpoint::resolve(argv[1], static_cast<std::uint16_t>(port));
    if (!to) {
        std::cerr << "resolve " << argv[1] << ": " << to.error().message << std::endl;
        return 1;
    }

    std::cout << "telemetry-relay frame_gen starting" << std::endl;
    std::cout << "Target: " << to->to_string() << ", count: " << count
              << ", rate: " << rate_hz << " Hz" << std::endl;

    const int rc = send_heartbeats(*to, count, rate_hz);

    std::cout << "frame_gen finished" << std::endl;
    return rc;
}
