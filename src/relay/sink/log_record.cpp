/**
 * @file log_record.cpp
 * @brief LogRecord JSON building.
 */
#include "relay/sink/log_record.hpp"

#include <ctime>
#include <cstdio>
#include <string>
#include <system_error>
#include <variant>

#include "relay/proto/frame.hpp"

namespace relay::sink {

// Keys keep insertion order: record layout first, payload fields in wire order.
using json = nlohmann::ordered_json;

std::string format_iso8601_utc(std::uint64_t us) {
    const std::time_t secs = static_cast<std::time_t>(us / 1'000'000ULL);
    const auto frac = static_cast<unsigned>(us % 1'000'000ULL);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06u+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return buf;
}

static json payload_of(const proto::DecodedMessage& m) {
    json p = json::object();
    // pymavlink's to_dict() leads with the message type; keep that shape.
    p["mavpackettype"] = m.msg_name;
    for (const auto& f : m.fields) {
        std::visit([&](const auto& v) { p[f.name] = v; }, f.value);
    }
    return p;
}

json make_log_record(const mem::RawFrame& frame, const proto::DecodeResult& decoded) {
    json j;
    j["timestamp"] = format_iso8601_utc(frame.timestamp_us);
    if (decoded) {
        const auto& m = *decoded;
        j["system_id"]    = m.system_id;
        j["component_id"] = m.component_id;
        j["msg_id"]       = m.msg_id;
        j["msg_name"]     = m.msg_name;
        j["seq"]          = m.seq;
        j["direction"]    = mem::to_string(frame.direction);
        j["payload"]      = payload_of(m);
        return j;
    }

    const auto hdr = proto::peek_header(frame.bytes);
    j["system_id"]    = hdr ? hdr->system_id : 0;
    j["component_id"] = hdr ? hdr->component_id : 0;
    j["msg_id"]       = hdr ? hdr->msg_id : 0;
    j["msg_name"]     = kUnknownMsgName;
    j["seq"]          = hdr ? hdr->seq : 0;
    j["direction"]    = mem::to_string(frame.direction);
    j["payload"]      = json::object();
    j["decode_error"] = proto::to_string(decoded.error());
    return j;
}

std::string to_json_line(const json& record) {
    auto line = record.dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

std::filesystem::path timestamped_path(const std::filesystem::path& dir, std::string_view prefix,
                                       std::string_view ext, std::chrono::system_clock::time_point start) {
    const std::time_t t = std::chrono::system_clock::to_time_t(start);
    std::tm tm{};
    localtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
    std::string name(prefix);
    name += '_';
    name += stamp;
    name += ext;
    return dir / name;
}

std::filesystem::path unused_path(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return path;
    const std::string stem = path.stem().string();
    const std::string ext  = path.extension().string();
    for (unsigned n = 1;; ++n) {
        auto candidate = path.parent_path() / (stem + "_" + std::to_string(n) + ext);
        if (!std::filesystem::exists(candidate, ec)) return candidate;
    }
}

} // namespace relay::sink
