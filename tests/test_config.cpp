/**
 * @file test_config.cpp
 * @brief Tests for the JSON config loader: defaults, overrides and validation.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "relay/config/config_loader.hpp"
#include "relay/config/constants.hpp"

namespace constants = relay::config::constants;
using relay::config::Loader;

TEST(ConfigLoader, Defaults) {
  const auto cfg = Loader::defaults();
  EXPECT_EQ(cfg.upstream.host, "0.0.0.0");
  EXPECT_EQ(cfg.upstream.port, 14550);
  ASSERT_EQ(cfg.forward.size(), 1u);
  EXPECT_EQ(cfg.forward[0].host, "127.0.0.1");
  EXPECT_EQ(cfg.forward[0].port, 14551);
  EXPECT_EQ(cfg.log_dir, "logs");
  EXPECT_EQ(cfg.archive_prefix, constants::ARCHIVE_PREFIX_DEFAULT);
  EXPECT_EQ(cfg.jsonl_prefix, constants::JSONL_PREFIX_DEFAULT);
  EXPECT_EQ(cfg.queue_capacity, constants::QUEUE_CAPACITY_DEFAULT);
  EXPECT_EQ(cfg.ingress.max_consecutive_errors, 3u);
  EXPECT_EQ(cfg.ingress.error_window_ms, 1000u);
  EXPECT_FALSE(cfg.strict_decode);
  EXPECT_EQ(cfg.threads.ingress.cpu, -1);
  EXPECT_FALSE(Loader::validate(cfg).has_value());
}

TEST(ConfigLoader, EmptyObjectKeepsDefaults) {
  auto cfg = Loader::load_from_string("{}");
  ASSERT_TRUE(cfg) << cfg.error().message;
  EXPECT_EQ(cfg->upstream.port, constants::UPSTREAM_PORT_DEFAULT);
  EXPECT_EQ(cfg->flush_interval_ms, constants::FLUSH_INTERVAL_MS_DEFAULT);
}

TEST(ConfigLoader, ParsesEveryKey) {
  auto cfg = Loader::load_from_string(R"({
    "upstream": {"host": "127.0.0.1", "port": 14540},
    "forward": [{"host": "127.0.0.1", "port": 14551}, {"host": "10.0.0.5", "port": 14552}],
    "log_dir": "/var/log/relay",
    "archive_prefix": "flight",
    "jsonl_prefix": "decoded",
    "queue_capacity": 4096,
    "flush_interval_ms": 250,
    "flush_every_records": 32,
    "shutdown_grace_ms": 500,
    "stats_interval_ms": 0,
    "strict_decode": true,
    "log_level": "debug",
    "ingress": {"recv_timeout_ms": 100, "max_consecutive_errors": 5,
                "error_window_ms": 2000, "max_datagram_bytes": 4096},
    "threads": {"ingress": {"cpu": 2, "priority": 80}, "jsonl": {"cpu": 3}}
  })");
  ASSERT_TRUE(cfg) << cfg.error().message;
  EXPECT_EQ(cfg->upstream.port, 14540);
  ASSERT_EQ(cfg->forward.size(), 2u);
  EXPECT_EQ(cfg->forward[1].host, "10.0.0.5");
  EXPECT_EQ(cfg->forward[1].port, 14552);
  EXPECT_EQ(cfg->log_dir, "/var/log/relay");
  EXPECT_EQ(cfg->archive_prefix, "flight");
  EXPECT_EQ(cfg->jsonl_prefix, "decoded");
  EXPECT_EQ(cfg->queue_capacity, 4096u);
  EXPECT_EQ(cfg->flush_interval_ms, 250u);
  EXPECT_EQ(cfg->flush_every_records, 32u);
  EXPECT_EQ(cfg->shutdown_grace_ms, 500u);
  EXPECT_EQ(cfg->stats_interval_ms, 0u);
  EXPECT_TRUE(cfg->strict_decode);
  EXPECT_EQ(cfg->log_level, "debug");
  EXPECT_EQ(cfg->ingress.recv_timeout_ms, 100u);
  EXPECT_EQ(cfg->ingress.max_consecutive_errors, 5u);
  EXPECT_EQ(cfg->ingress.error_window_ms, 2000u);
  EXPECT_EQ(cfg->ingress.max_datagram_bytes, 4096u);
  EXPECT_EQ(cfg->threads.ingress.cpu, 2);
  EXPECT_EQ(cfg->threads.ingress.priority, 80);
  EXPECT_EQ(cfg->threads.jsonl.cpu, 3);
  EXPECT_EQ(cfg->threads.publish.cpu, -1);
}

TEST(ConfigLoader, PartialEndpointKeepsDefaultHost) {
  auto cfg = Loader::load_from_string(R"({"upstream": {"port": 15000}})");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->upstream.host, constants::UPSTREAM_HOST_DEFAULT);
  EXPECT_EQ(cfg->upstream.port, 15000);
}

TEST(ConfigLoader, InvalidJson) {
  auto cfg = Loader::load_from_string("{ not json");
  ASSERT_FALSE(cfg);
  EXPECT_NE(cfg.error().message.find("JSON"), std::string::npos);

  auto arr = Loader::load_from_string("[1, 2]");
  ASSERT_FALSE(arr);
}

TEST(ConfigLoader, TypeErrorsAreReported) {
  EXPECT_FALSE(Loader::load_from_string(R"({"queue_capacity": "big"})"));
  EXPECT_FALSE(Loader::load_from_string(R"({"upstream": {"port": "x"}})"));
  EXPECT_FALSE(Loader::load_from_string(R"({"strict_decode": 3})"));
}

TEST(ConfigLoader, ValidationRejects) {
  const char* bad[] = {
    R"({"upstream": {"port": 0}})",
    R"({"upstream": {"port": 70000}})",
    R"({"forward": []})",
    R"({"forward": [{"host": "127.0.0.1", "port": 0}]})",
    R"({"queue_capacity": 0})",
    R"({"flush_interval_ms": 0})",
    R"({"flush_every_records": 0})",
    R"({"ingress": {"recv_timeout_ms": 0}})",
    R"({"ingress": {"max_consecutive_errors": 0}})",
    R"({"ingress": {"max_datagram_bytes": 0}})",
    R"({"ingress": {"error_window_ms": 0}})",
    R"({"log_dir": ""})",
  };
  for (const char* text : bad) {
    auto cfg = Loader::load_from_string(text);
    EXPECT_FALSE(cfg) << text;
    if (!cfg) EXPECT_FALSE(cfg.error().message.empty()) << text;
  }
}

TEST(ConfigLoader, NegativeNumbersRejected) {
  const char* bad[] = {
    R"({"queue_capacity": -1})",
    R"({"flush_interval_ms": -5})",
    R"({"shutdown_grace_ms": -1})",
    R"({"ingress": {"max_datagram_bytes": -1}})",
    R"({"ingress": {"error_window_ms": -1000}})",
  };
  for (const char* text : bad) {
    auto cfg = Loader::load_from_string(text);
    ASSERT_FALSE(cfg) << text;
    EXPECT_NE(cfg.error().message.find("out of range"), std::string::npos) << text;
  }
}

TEST(ConfigLoader, OversizedValuesRejected) {
  const char* bad[] = {
    R"({"queue_capacity": 18446744073709551615})",
    R"({"queue_capacity": 1000001})",
    R"({"ingress": {"max_datagram_bytes": 1099511627776}})",
    R"({"ingress": {"max_datagram_bytes": 65536}})",
    R"({"flush_every_records": 4294967296})",
    R"({"threads": {"ingress": {"cpu": 4294967296}}})",
  };
  for (const char* text : bad) {
    auto cfg = Loader::load_from_string(text);
    EXPECT_FALSE(cfg) << text;
  }
}

TEST(ConfigLoader, UpperBoundsAccepted) {
  auto cfg = Loader::load_from_string(R"({
    "queue_capacity": 1000000,
    "ingress": {"max_datagram_bytes": 65535},
    "threads": {"publish": {"cpu": -1, "priority": 10}}
  })");
  ASSERT_TRUE(cfg) << cfg.error().message;
  EXPECT_EQ(cfg->queue_capacity, constants::QUEUE_CAPACITY_MAX);
  EXPECT_EQ(cfg->ingress.max_datagram_bytes, constants::INGRESS_MAX_DATAGRAM_MAX);
  EXPECT_EQ(cfg->threads.publish.priority, 10);
}

TEST(ConfigLoader, LoadFromFile) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("relay_config_" + std::to_string(::getpid()) + ".json");
  {
    std::ofstream out(path);
    out << R"({"queue_capacity": 64, "log_level": "warn"})";
  }
  auto cfg = Loader::load_from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(cfg) << cfg.error().message;
  EXPECT_EQ(cfg->queue_capacity, 64u);
  EXPECT_EQ(cfg->log_level, "warn");

  auto missing = Loader::load_from_file("/nonexistent/relay.json");
  ASSERT_FALSE(missing);
  EXPECT_NE(missing.error().message.find("/nonexistent/relay.json"), std::string::npos);
}
