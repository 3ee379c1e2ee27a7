/**
 * @file archive_writer.cpp
 * @brief .tlog archive sink.
 */
#include "relay/sink/archive_writer.hpp"

#include <cerrno>
#include <cstring>

namespace relay::sink {

void encode_archive_record(const mem::RawFrame& frame, std::vector<std::uint8_t>& out) {
    out.clear();
    out.reserve(kArchiveHeaderLen + frame.bytes.size());
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((frame.timestamp_us >> shift) & 0xFF));
    }
    out.insert(out.end(), frame.bytes.begin(), frame.bytes.end());
}

relay_detail::expected<std::unique_ptr<ArchiveWriter>, OpenError>
ArchiveWriter::open(const std::filesystem::path& path) {
    std::unique_ptr<ArchiveWriter> w(new ArchiveWriter(path));
    w->out_.open(path, std::ios::binary | std::ios::app);
    if (!w->out_) {
        return relay_detail::unexpected(OpenError{"cannot open archive " + path.string() + ": " +
                                                  std::strerror(errno)});
    }
    return w;
}

ArchiveWriter::ArchiveWriter(std::filesystem::path path) : path_(std::move(path)) {}

ArchiveWriter::~ArchiveWriter() { close(); }

std::string ArchiveWriter::describe() const { return path_.string(); }

SinkStatus ArchiveWriter::write(const mem::RawFrame& frame) {
    if (!out_.is_open() || !out_) return SinkStatus::Failed;
    encode_archive_record(frame, record_);
    out_.write(reinterpret_cast<const char*>(record_.data()), static_cast<std::streamsize>(record_.size()));
    return out_ ? SinkStatus::Ok : SinkStatus::Failed;
}

SinkStatus ArchiveWriter::flush() {
    if (!out_.is_open()) return SinkStatus::Failed;
    out_.flush();
    return out_ ? SinkStatus::Ok : SinkStatus::Failed;
}

void ArchiveWriter::close() noexcept {
    if (!out_.is_open()) return;
    out_.close();
}

} // namespace relay::sink
