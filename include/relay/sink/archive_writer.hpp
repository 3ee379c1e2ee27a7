#pragma once
/**
 * @file archive_writer.hpp
 * @brief Binary archive (.tlog): [uint64 BE timestamp_us][raw frame bytes] per record.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "relay/compat/expected.hpp"
#include "relay/sink/frame_sink.hpp"

namespace relay::sink {

/// Size of the per-record timestamp header.
inline constexpr std::size_t kArchiveHeaderLen = 8;

/**
 * @class ArchiveWriter
 * @brief Append-only archive compatible with MAVProxy/QGC telemetry logs.
 */
class ArchiveWriter final : public FrameSink {
public:
    /// @brief Open (create or append) @p path.
    static relay_detail::expected<std::unique_ptr<ArchiveWriter>, OpenError>
    open(const std::filesystem::path& path);

    ~ArchiveWriter() override;

    std::string describe() const override;
    SinkStatus write(const mem::RawFrame& frame) override;
    SinkStatus flush() override;
    void close() noexcept override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit ArchiveWriter(std::filesystem::path path);

    std::filesystem::path     path_;
    std::ofstream             out_;
    std::vector<std::uint8_t> record_;  ///< Reused record buffer
};

/// @brief Encode one archive record (header + bytes) into @p out.
void encode_archive_record(const mem::RawFrame& frame, std::vector<std::uint8_t>& out);

} // namespace relay::sink
