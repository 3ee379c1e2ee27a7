/**
 * @file decoder.cpp
 * @brief MAVLink v1/v2 frame validation and payload field extraction.
 */
#include "relay/proto/decoder.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstring>

#include "relay/proto/catalogue.hpp"
#include "relay/proto/crc.hpp"
#include "relay/proto/frame.hpp"

namespace relay::proto {

const char* to_string(DecodeError e) noexcept {
    switch (e) {
        case DecodeError::Empty:            return "empty";
        case DecodeError::BadMagic:         return "bad_magic";
        case DecodeError::Truncated:        return "truncated";
        case DecodeError::ChecksumMismatch: return "checksum_mismatch";
        case DecodeError::UnknownMessage:   return "unknown_message";
    }
    return "unknown";
}

std::optional<FrameHeader> peek_header(std::span<const std::uint8_t> b) noexcept {
    if (b.empty()) return std::nullopt;
    FrameHeader h;
    if (b[0] == kStxV1) {
        if (b.size() < kHeaderLenV1) return std::nullopt;
        h.version      = 1;
        h.payload_len  = b[1];
        h.seq          = b[2];
        h.system_id    = b[3];
        h.component_id = b[4];
        h.msg_id       = b[5];
        return h;
    }
    if (b[0] == kStxV2) {
        if (b.size() < kHeaderLenV2) return std::nullopt;
        h.version        = 2;
        h.payload_len    = b[1];
        h.incompat_flags = b[2];
        h.compat_flags   = b[3];
        h.seq            = b[4];
        h.system_id      = b[5];
        h.component_id   = b[6];
        h.msg_id         = static_cast<std::uint32_t>(b[7]) |
                           (static_cast<std::uint32_t>(b[8]) << 8) |
                           (static_cast<std::uint32_t>(b[9]) << 16);
        return h;
    }
    return std::nullopt;
}

namespace {

std::uint64_t read_le(const std::uint8_t* p, std::size_t n) noexcept {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i) v |= static_cast<std::uint64_t>(p[i]) << (8 * i);
    return v;
}

bool is_signed_type(FieldType t) noexcept {
    return t == FieldType::I8 || t == FieldType::I16 || t == FieldType::I32 || t == FieldType::I64;
}

bool is_float_type(FieldType t) noexcept {
    return t == FieldType::F32 || t == FieldType::F64;
}

std::int64_t read_signed(const std::uint8_t* p, FieldType t) noexcept {
    switch (t) {
        case FieldType::I8:  return static_cast<std::int8_t>(p[0]);
        case FieldType::I16: return static_cast<std::int16_t>(read_le(p, 2));
        case FieldType::I32: return static_cast<std::int32_t>(read_le(p, 4));
        default:             return static_cast<std::int64_t>(read_le(p, 8));
    }
}

double read_float(const std::uint8_t* p, FieldType t) noexcept {
    if (t == FieldType::F32) return std::bit_cast<float>(static_cast<std::uint32_t>(read_le(p, 4)));
    return std::bit_cast<double>(read_le(p, 8));
}

/// char[N] -> string cut at the first NUL.
std::string read_chars(const std::uint8_t* p, std::size_t n) {
    const auto* end = std::find(p, p + n, std::uint8_t{0});
    return std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(end - p));
}

FieldValue read_field(const std::uint8_t* p, const FieldSpec& f) {
    const auto sz = type_size(f.type);
    if (f.type == FieldType::Char) return read_chars(p, f.array_len == 0 ? 1 : f.array_len);

    if (f.array_len == 0) {
        if (is_float_type(f.type))  return read_float(p, f.type);
        if (is_signed_type(f.type)) return read_signed(p, f.type);
        return read_le(p, sz);
    }

    if (is_float_type(f.type)) {
        std::vector<double> v; v.reserve(f.array_len);
        for (std::size_t i = 0; i < f.array_len; ++i) v.push_back(read_float(p + i * sz, f.type));
        return v;
    }
    if (is_signed_type(f.type)) {
        std::vector<std::int64_t> v; v.reserve(f.array_len);
        for (std::size_t i = 0; i < f.array_len; ++i) v.push_back(read_signed(p + i * sz, f.type));
        return v;
    }
    std::vector<std::uint64_t> v; v.reserve(f.array_len);
    for (std::size_t i = 0; i < f.array_len; ++i) v.push_back(read_le(p + i * sz, sz));
    return v;
}

} // namespace

DecodeResult decode(std::span<const std::uint8_t> bytes, DecodeOptions opts) {
    if (bytes.empty()) return relay_detail::unexpected(DecodeError::Empty);
    if (bytes[0] != kStxV1 && bytes[0] != kStxV2) return relay_detail::unexpected(DecodeError::BadMagic);

    const auto hdr = peek_header(bytes);
    if (!hdr || bytes.size() < hdr->frame_len()) return relay_detail::unexpected(DecodeError::Truncated);

    const MessageSpec* spec = find_message(hdr->msg_id);
    if (!spec && opts.strict) return relay_detail::unexpected(DecodeError::UnknownMessage);

    const std::size_t payload_off = hdr->header_len();
    const std::size_t crc_off     = payload_off + hdr->payload_len;

    DecodedMessage m;
    m.msg_id       = hdr->msg_id;
    m.system_id    = hdr->system_id;
    m.component_id = hdr->component_id;
    m.seq          = hdr->seq;
    m.version      = hdr->version;
    m.raw.assign(bytes.begin(), bytes.end());

    if (!spec) {
        // Without CRC_EXTRA the checksum cannot be verified; keep the header only.
        m.msg_name = "UNKNOWN_" + std::to_string(hdr->msg_id);
        return m;
    }

    auto crc = crc_calculate(bytes.subspan(1, crc_off - 1));
    crc = crc_accumulate(spec->crc_extra, crc);
    const auto wire_crc = static_cast<std::uint16_t>(read_le(bytes.data() + crc_off, kChecksumLen));
    if (crc != wire_crc) return relay_detail::unexpected(DecodeError::ChecksumMismatch);

    // v2 senders strip trailing zero bytes; restore them before slicing fields.
    std::array<std::uint8_t, kMaxPayloadLen> payload{};
    std::memcpy(payload.data(), bytes.data() + payload_off, hdr->payload_len);

    m.msg_name = spec->name;
    m.known    = true;
    m.fields.reserve(spec->fields.size());
    std::size_t off = 0;
    for (const auto& f : spec->fields) {
        m.fields.push_back(Field{f.name, read_field(payload.data() + off, f)});
        off += f.wire_size();
    }
    return m;
}

} // namespace relay::proto
