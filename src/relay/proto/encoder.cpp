/**
 * @file encoder.cpp
 * @brief v1/v2 frame assembly with checksum.
 */
#include "relay/proto/encoder.hpp"

#include "relay/proto/crc.hpp"
#include "relay/proto/frame.hpp"

namespace relay::proto {

PayloadWriter& PayloadWriter::put_chars(std::string_view s, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        buf_.push_back(i < s.size() ? static_cast<std::uint8_t>(s[i]) : std::uint8_t{0});
    }
    return *this;
}

static void append_checksum(std::vector<std::uint8_t>& f, std::uint8_t crc_extra) {
    auto crc = crc_calculate(std::span<const std::uint8_t>(f).subspan(1));
    crc = crc_accumulate(crc_extra, crc);
    f.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    f.push_back(static_cast<std::uint8_t>(crc >> 8));
}

std::vector<std::uint8_t> encode_v1(const FrameFields& h, std::span<const std::uint8_t> payload,
                                    std::uint8_t crc_extra) {
    const auto len = payload.size() > kMaxPayloadLen ? kMaxPayloadLen : payload.size();
    std::vector<std::uint8_t> f;
    f.reserve(kHeaderLenV1 + len + kChecksumLen);
    f.push_back(kStxV1);
    f.push_back(static_cast<std::uint8_t>(len));
    f.push_back(h.seq);
    f.push_back(h.system_id);
    f.push_back(h.component_id);
    f.push_back(static_cast<std::uint8_t>(h.msg_id & 0xFF));
    f.insert(f.end(), payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(len));
    append_checksum(f, crc_extra);
    return f;
}

std::vector<std::uint8_t> encode_v2(const FrameFields& h, std::span<const std::uint8_t> payload,
                                    std::uint8_t crc_extra) {
    auto len = payload.size() > kMaxPayloadLen ? kMaxPayloadLen : payload.size();
    // Payload truncation: drop trailing zeros but always keep the first byte.
    while (len > 1 && payload[len - 1] == 0) --len;

    std::vector<std::uint8_t> f;
    f.reserve(kHeaderLenV2 + len + kChecksumLen);
    f.push_back(kStxV2);
    f.push_back(static_cast<std::uint8_t>(len));
    f.push_back(0);  // incompat flags
    f.push_back(0);  // compat flags
    f.push_back(h.seq);
    f.push_back(h.system_id);
    f.push_back(h.component_id);
    f.push_back(static_cast<std::uint8_t>(h.msg_id & 0xFF));
    f.push_back(static_cast<std::uint8_t>((h.msg_id >> 8) & 0xFF));
    f.push_back(static_cast<std::uint8_t>((h.msg_id >> 16) & 0xFF));
    f.insert(f.end(), payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(len));
    append_checksum(f, crc_extra);
    return f;
}

std::vector<std::uint8_t> encode_v2(const MessageSpec& spec, FrameFields h,
                                    std::span<const std::uint8_t> payload) {
    h.msg_id = spec.id;
    return encode_v2(h, payload, spec.crc_extra);
}

std::vector<std::uint8_t> heartbeat_payload(const Heartbeat& hb) {
    PayloadWriter w;
    w.put(hb.custom_mode).put(hb.type).put(hb.autopilot).put(hb.base_mode)
     .put(hb.system_status).put(hb.mavlink_version);
    return w.bytes();
}

} // namespace relay::proto
