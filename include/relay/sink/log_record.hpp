#pragma once
/**
 * @file log_record.hpp
 * @brief JSON projection of one frame, and timestamp/file-name formatting.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "relay/mem/raw_frame.hpp"
#include "relay/proto/decoder.hpp"

namespace relay::sink {

/// Sentinel msg_name for frames that failed to decode.
inline constexpr const char* kUnknownMsgName = "UNKNOWN";

/**
 * @brief ISO-8601 UTC timestamp with microseconds, e.g. "2024-05-01T12:00:00.000123+00:00".
 * @param us Microseconds since the Unix epoch.
 */
std::string format_iso8601_utc(std::uint64_t us);

/**
 * @brief Build the LogRecord for one frame.
 *
 * Keys: timestamp, system_id, component_id, msg_id, msg_name, seq, direction,
 * payload. On decode failure the header fields come from whatever header could
 * be read (0 otherwise), msg_name is "UNKNOWN", payload is {} and decode_error
 * names the reason.
 */
nlohmann::ordered_json make_log_record(const mem::RawFrame& frame, const proto::DecodeResult& decoded);

/// Serialize @p record as one line (invalid UTF-8 replaced, trailing '\n').
std::string to_json_line(const nlohmann::ordered_json& record);

/**
 * @brief "<dir>/<prefix>_YYYYmmdd_HHMMSS<ext>" using local time of @p start.
 */
std::filesystem::path timestamped_path(const std::filesystem::path& dir, std::string_view prefix,
                                       std::string_view ext, std::chrono::system_clock::time_point start);

/// @p path itself if nothing exists there, else the first free `<stem>_<n><ext>`.
std::filesystem::path unused_path(const std::filesystem::path& path);

} // namespace relay::sink
