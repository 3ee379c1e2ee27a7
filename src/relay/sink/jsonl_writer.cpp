/**
 * @file jsonl_writer.cpp
 * @brief JSON Lines sink.
 */
#include "relay/sink/jsonl_writer.hpp"

#include <cerrno>
#include <cstring>

#include "relay/obs/log.hpp"
#include "relay/sink/log_record.hpp"

namespace relay::sink {

relay_detail::expected<std::unique_ptr<JsonlWriter>, OpenError>
JsonlWriter::open(const std::filesystem::path& path, proto::DecodeOptions opts) {
    std::unique_ptr<JsonlWriter> w(new JsonlWriter(path, opts));
    w->out_.open(path, std::ios::out | std::ios::app);
    if (!w->out_) {
        return relay_detail::unexpected(OpenError{"cannot open json log " + path.string() + ": " +
                                                  std::strerror(errno)});
    }
    return w;
}

JsonlWriter::JsonlWriter(std::filesystem::path path, proto::DecodeOptions opts)
    : path_(std::move(path)), opts_(opts) {}

JsonlWriter::~JsonlWriter() { close(); }

std::string JsonlWriter::describe() const { return path_.string(); }

SinkStatus JsonlWriter::write(const mem::RawFrame& frame) {
    if (!out_.is_open() || !out_) return SinkStatus::Failed;

    const auto decoded = proto::decode(frame.bytes, opts_);
    if (!decoded) {
        // First few at debug for diagnosis; the record itself carries decode_error.
        if (decode_failures_++ < 10) {
            obs::log().debug("jsonl: decode failed ({}) for {}-byte frame",
                             proto::to_string(decoded.error()), frame.bytes.size());
        }
    }
    const auto line = to_json_line(make_log_record(frame, decoded));
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    return out_ ? SinkStatus::Ok : SinkStatus::Failed;
}

SinkStatus JsonlWriter::flush() {
    if (!out_.is_open()) return SinkStatus::Failed;
    out_.flush();
    return out_ ? SinkStatus::Ok : SinkStatus::Failed;
}

void JsonlWriter::close() noexcept {
    if (!out_.is_open()) return;
    out_.close();
}

} // namespace relay::sink
