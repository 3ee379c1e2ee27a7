#pragma once
/**
 * @file jsonl_writer.hpp
 * @brief Structured log sink: decode each frame, append one JSON object per line.
 */

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>

#include "relay/compat/expected.hpp"
#include "relay/proto/decoder.hpp"
#include "relay/sink/frame_sink.hpp"

namespace relay::sink {

/**
 * @class JsonlWriter
 * @brief Decoder + JSON Lines file. Decode failures still produce a line.
 */
class JsonlWriter final : public FrameSink {
public:
    /// @brief Open (create or append) @p path.
    static relay_detail::expected<std::unique_ptr<JsonlWriter>, OpenError>
    open(const std::filesystem::path& path, proto::DecodeOptions opts = {});

    ~JsonlWriter() override;

    std::string describe() const override;
    SinkStatus write(const mem::RawFrame& frame) override;
    SinkStatus flush() override;
    void close() noexcept override;

    const std::filesystem::path& path() const noexcept { return path_; }

    /// Frames that failed to decode so far (written with an empty payload).
    std::uint64_t decode_failures() const noexcept { return decode_failures_; }

private:
    JsonlWriter(std::filesystem::path path, proto::DecodeOptions opts);

    std::filesystem::path path_;
    proto::DecodeOptions  opts_;
    std::ofstream         out_;
    std::uint64_t         decode_failures_{0};
};

} // namespace relay::sink
