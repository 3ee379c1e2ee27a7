/**
 * @file main.cpp
 * @brief relay_app: MAVLink telemetry relay with .tlog and JSON Lines logging.
 *
 * **Bootstrap**
 * - Load config (JSON file or named defaults); init the spdlog logger.
 * - Open log files, downstream publisher and upstream socket (Relay::create).
 *
 * **Run**
 * - Ingress loop on the main thread; three sink workers (publish, archive, jsonl).
 *
 * **Lifecycle**
 * - SIGINT/SIGTERM: stop ingress, drain within shutdown_grace_ms, close files.
 * - Exit codes: 0 clean stop, 1 setup failure, 2 upstream unreachable.
 *
 * Usage:
 *   ./relay_app [config.json]
 */

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "relay/config/config_loader.hpp"
#include "relay/obs/log.hpp"
#include "relay/pipeline/relay.hpp"
#include "relay/version.hpp"

namespace {

std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true, std::memory_order_release); }

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

void print_banner(const relay::config::RelayConfig& cfg, const relay::pipeline::Relay& r) {
  std::cout
    << "telemetry-relay " << relay::version_string << '\n'
    << "--------------------------------------------------\n"
    << "Upstream (vehicle):  udp:" << cfg.upstream.host << ':' << cfg.upstream.port << '\n';
  for (const auto& f : cfg.forward) {
    std::cout << "Forwarding to:       udp:" << f.host << ':' << f.port << '\n';
  }
  std::cout
    << "Archive log:         " << r.archive_path().string() << '\n'
    << "JSON Lines log:      " << r.jsonl_path().string() << '\n'
    << '\n'
    << "QGroundControl setup:\n"
    << "  1) Application Settings -> Comm Links\n"
    << "  2) Add a UDP link, server " << cfg.forward.front().host
    << ", port " << cfg.forward.front().port << '\n'
    << "  3) Connect\n"
    << '\n'
    << "Press Ctrl+C to stop" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  using relay::config::Loader;

  relay_detail::expected<relay::config::RelayConfig, relay::config::ConfigError> cfg = Loader::defaults();
  if (argc > 1) cfg = Loader::load_from_file(argv[1]);
  if (!cfg) {
    relay::obs::init_logging("info");
    relay::obs::log().error("config: {}", cfg.error().message);
    return 1;
  }
  relay::obs::init_logging(cfg->log_level);

  auto app = relay::pipeline::Relay::create(*cfg);
  if (!app) {
    relay::obs::log().error("setup: {}", app.error().message);
    return 1;
  }

  install_signal_handlers();
  print_banner(*cfg, **app);

  const auto outcome = (*app)->run(g_stop);
  (*app)->shutdown();

  if (outcome == relay::pipeline::RunOutcome::UpstreamUnreachable) {
    relay::obs::log().critical("upstream unreachable, exiting");
    return 2;
  }
  relay::obs::log().info("relay stopped");
  return 0;
}
