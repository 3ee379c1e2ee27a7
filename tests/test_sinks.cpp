/**
 * @file test_sinks.cpp
 * @brief Tests for the archive (.tlog) and JSON Lines sinks and record formatting.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "relay/mem/raw_frame.hpp"
#include "relay/proto/catalogue.hpp"
#include "relay/proto/decoder.hpp"
#include "relay/proto/encoder.hpp"
#include "relay/sink/archive_writer.hpp"
#include "relay/sink/jsonl_writer.hpp"
#include "relay/sink/log_record.hpp"

namespace fs = std::filesystem;
using nlohmann::json;
using relay::mem::RawFrame;
using relay::sink::ArchiveWriter;
using relay::sink::JsonlWriter;
using relay::sink::SinkStatus;

namespace {

/// Fresh directory per test, removed on teardown.
class SinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() /
           ("relay_sinks_" + std::string(info->name()) + "_" + std::to_string(::getpid()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

RawFrame heartbeat(std::uint8_t seq, std::uint64_t ts) {
  relay::proto::FrameFields h;
  h.seq = seq;
  RawFrame f;
  f.bytes = relay::proto::encode_v2(*relay::proto::find_message("HEARTBEAT"), h,
                                    relay::proto::heartbeat_payload(relay::proto::Heartbeat{}));
  f.timestamp_us = ts;
  return f;
}

std::vector<std::uint8_t> read_bytes(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::ifstream in(p);
  std::vector<std::string> out;
  for (std::string line; std::getline(in, line);) out.push_back(line);
  return out;
}

std::uint64_t be64(const std::uint8_t* p) {
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
  return v;
}

} // namespace

// ---------- Record formatting ----------

TEST(LogRecord, Iso8601Utc) {
  EXPECT_EQ(relay::sink::format_iso8601_utc(0), "1970-01-01T00:00:00.000000+00:00");
  EXPECT_EQ(relay::sink::format_iso8601_utc(1714564800000123ULL), "2024-05-01T12:00:00.000123+00:00");
}

TEST(LogRecord, DecodedFrame_KeysAndPayload) {
  const auto f = heartbeat(7, 1714564800000000ULL);
  const auto rec = relay::sink::make_log_record(f, relay::proto::decode(f.bytes));

  std::vector<std::string> keys;
  for (auto it = rec.begin(); it != rec.end(); ++it) keys.push_back(it.key());
  EXPECT_EQ(keys, (std::vector<std::string>{"timestamp", "system_id", "component_id", "msg_id",
                                            "msg_name", "seq", "direction", "payload"}));

  EXPECT_EQ(rec["timestamp"], "2024-05-01T12:00:00.000000+00:00");
  EXPECT_EQ(rec["msg_id"], 0);
  EXPECT_EQ(rec["msg_name"], "HEARTBEAT");
  EXPECT_EQ(rec["seq"], 7);
  EXPECT_EQ(rec["direction"], "RX");
  EXPECT_EQ(rec["payload"]["mavpackettype"], "HEARTBEAT");
  EXPECT_EQ(rec["payload"]["autopilot"], 12);
  EXPECT_FALSE(rec.contains("decode_error"));
}

TEST(LogRecord, FailedDecode_EmptyPayloadAndReason) {
  auto f = heartbeat(9, 42);
  f.bytes.back() ^= 0xFF;  // break the checksum, header still readable
  const auto rec = relay::sink::make_log_record(f, relay::proto::decode(f.bytes));

  EXPECT_EQ(rec["msg_name"], "UNKNOWN");
  EXPECT_EQ(rec["seq"], 9);
  EXPECT_EQ(rec["system_id"], 1);
  EXPECT_EQ(rec["direction"], "RX");
  EXPECT_TRUE(rec["payload"].is_object());
  EXPECT_TRUE(rec["payload"].empty());
  EXPECT_EQ(rec["decode_error"], "checksum_mismatch");

  RawFrame junk;
  junk.bytes = {0x00, 0x01};
  const auto j = relay::sink::make_log_record(junk, relay::proto::decode(junk.bytes));
  EXPECT_EQ(j["msg_id"], 0);
  EXPECT_EQ(j["decode_error"], "bad_magic");
}

TEST(LogRecord, InvalidUtf8IsReplaced) {
  const auto* spec = relay::proto::find_message("STATUSTEXT");
  relay::proto::PayloadWriter w;
  w.put(std::uint8_t{4}).put_chars(std::string("ok\xff\xfe"), 50);
  RawFrame f;
  f.bytes = relay::proto::encode_v2(*spec, relay::proto::FrameFields{}, w.bytes());

  const auto line = relay::sink::to_json_line(relay::sink::make_log_record(f, relay::proto::decode(f.bytes)));
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  const auto parsed = json::parse(line);
  EXPECT_EQ(parsed["payload"]["text"].get<std::string>().substr(0, 2), "ok");
}

TEST(LogRecord, TimestampedPath) {
  std::tm tm{};
  tm.tm_year = 2024 - 1900;
  tm.tm_mon  = 4;
  tm.tm_mday = 1;
  tm.tm_hour = 9;
  tm.tm_min  = 5;
  tm.tm_sec  = 7;
  tm.tm_isdst = -1;
  const auto tp = std::chrono::system_clock::from_time_t(std::mktime(&tm));
  const auto p = relay::sink::timestamped_path("logs", "mavproxy_log", ".tlog", tp);
  EXPECT_EQ(p, fs::path("logs") / "mavproxy_log_20240501_090507.tlog");
}

TEST_F(SinkTest, UnusedPath_SkipsExistingFiles) {
  const auto base = dir_ / "mavproxy_log_20240501_090507.tlog";
  EXPECT_EQ(relay::sink::unused_path(base), base);

  std::ofstream(base).put('x');
  const auto second = relay::sink::unused_path(base);
  EXPECT_EQ(second, dir_ / "mavproxy_log_20240501_090507_1.tlog");

  std::ofstream(second).put('x');
  EXPECT_EQ(relay::sink::unused_path(base), dir_ / "mavproxy_log_20240501_090507_2.tlog");
}

// ---------- ArchiveWriter ----------

TEST_F(SinkTest, Archive_RecordLayout) {
  const auto path = dir_ / "a.tlog";
  auto w = ArchiveWriter::open(path);
  ASSERT_TRUE(w) << w.error().message;

  std::vector<RawFrame> frames;
  for (std::uint8_t i = 0; i < 5; ++i) frames.push_back(heartbeat(i, 1000000ULL + i));
  for (const auto& f : frames) EXPECT_EQ((*w)->write(f), SinkStatus::Ok);
  EXPECT_EQ((*w)->flush(), SinkStatus::Ok);
  (*w)->close();

  const auto bytes = read_bytes(path);
  const std::size_t rec_len = relay::sink::kArchiveHeaderLen + frames[0].bytes.size();
  ASSERT_EQ(bytes.size(), frames.size() * rec_len);
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const auto* rec = bytes.data() + i * rec_len;
    EXPECT_EQ(be64(rec), frames[i].timestamp_us);
    const std::vector<std::uint8_t> body(rec + relay::sink::kArchiveHeaderLen, rec + rec_len);
    EXPECT_EQ(body, frames[i].bytes);
  }
}

TEST_F(SinkTest, Archive_AppendsToExistingFile) {
  const auto path = dir_ / "b.tlog";
  {
    auto w = ArchiveWriter::open(path);
    ASSERT_TRUE(w);
    EXPECT_EQ((*w)->write(heartbeat(1, 1)), SinkStatus::Ok);
  }
  {
    auto w = ArchiveWriter::open(path);
    ASSERT_TRUE(w);
    EXPECT_EQ((*w)->write(heartbeat(2, 2)), SinkStatus::Ok);
  }
  EXPECT_EQ(read_bytes(path).size(), 2 * (relay::sink::kArchiveHeaderLen + heartbeat(0, 0).bytes.size()));
}

TEST_F(SinkTest, Archive_OpenFailsForMissingDirectory) {
  auto w = ArchiveWriter::open(dir_ / "missing" / "x.tlog");
  ASSERT_FALSE(w);
  EXPECT_NE(w.error().message.find("x.tlog"), std::string::npos);
}

TEST_F(SinkTest, Archive_WriteAfterCloseFails) {
  auto w = ArchiveWriter::open(dir_ / "c.tlog");
  ASSERT_TRUE(w);
  (*w)->close();
  (*w)->close();  // idempotent
  EXPECT_EQ((*w)->write(heartbeat(0, 0)), SinkStatus::Failed);
}

/**
 * @test Archive_DeviceFull_ReportsFailure
 * @brief A device that rejects every write surfaces as Failed (at write or flush).
 */
TEST(ArchiveWriterDevice, DeviceFull_ReportsFailure) {
  if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
  auto w = ArchiveWriter::open("/dev/full");
  ASSERT_TRUE(w);
  const auto wrote = (*w)->write(heartbeat(0, 0));
  const auto flushed = (*w)->flush();
  EXPECT_TRUE(wrote == SinkStatus::Failed || flushed == SinkStatus::Failed);
}

// ---------- JsonlWriter ----------

TEST_F(SinkTest, Jsonl_OneParseableLinePerFrame) {
  const auto path = dir_ / "m.jsonl";
  auto w = JsonlWriter::open(path);
  ASSERT_TRUE(w) << w.error().message;

  constexpr int N = 20;
  for (int i = 0; i < N; ++i) {
    EXPECT_EQ((*w)->write(heartbeat(static_cast<std::uint8_t>(i), 1000 + i)), SinkStatus::Ok);
  }
  EXPECT_EQ((*w)->flush(), SinkStatus::Ok);
  (*w)->close();

  const auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), static_cast<std::size_t>(N));
  for (int i = 0; i < N; ++i) {
    const auto j = json::parse(lines[i]);
    EXPECT_EQ(j["seq"], i);
    EXPECT_EQ(j["msg_name"], "HEARTBEAT");
  }
  EXPECT_EQ((*w)->decode_failures(), 0u);
}

TEST_F(SinkTest, Jsonl_DecodeFailureStillWritesLine) {
  const auto path = dir_ / "k.jsonl";
  auto w = JsonlWriter::open(path);
  ASSERT_TRUE(w);

  auto bad = heartbeat(2, 2000);
  bad.bytes[12] ^= 0x10;
  EXPECT_EQ((*w)->write(heartbeat(1, 1000)), SinkStatus::Ok);
  EXPECT_EQ((*w)->write(bad), SinkStatus::Ok);
  EXPECT_EQ((*w)->write(heartbeat(3, 3000)), SinkStatus::Ok);
  (*w)->close();

  const auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 3u);
  const auto prev = json::parse(lines[0]);
  const auto mid  = json::parse(lines[1]);
  const auto next = json::parse(lines[2]);
  EXPECT_EQ(prev["msg_name"], "HEARTBEAT");
  EXPECT_EQ(next["msg_name"], "HEARTBEAT");
  EXPECT_EQ(mid["msg_name"], "UNKNOWN");
  EXPECT_EQ(mid["direction"], "RX");
  EXPECT_EQ(mid["timestamp"], relay::sink::format_iso8601_utc(2000));
  EXPECT_TRUE(mid["payload"].empty());
  EXPECT_EQ((*w)->decode_failures(), 1u);
}

TEST_F(SinkTest, Jsonl_StrictModeRejectsUnknownIds) {
  const auto path = dir_ / "s.jsonl";
  auto w = JsonlWriter::open(path, relay::proto::DecodeOptions{true});
  ASSERT_TRUE(w);

  relay::proto::FrameFields h;
  h.msg_id = 4242;
  RawFrame f;
  f.bytes = relay::proto::encode_v2(h, std::vector<std::uint8_t>{1, 2}, 0);
  EXPECT_EQ((*w)->write(f), SinkStatus::Ok);
  (*w)->close();

  const auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 1u);
  const auto j = json::parse(lines[0]);
  EXPECT_EQ(j["msg_id"], 4242);
  EXPECT_EQ(j["decode_error"], "unknown_message");
}
