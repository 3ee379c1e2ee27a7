#pragma once
/**
 * @file decoder.hpp
 * @brief Frame decoder: raw datagram bytes -> DecodedMessage or DecodeError.
 * @details Pure and stateless; safe to call concurrently on independent frames.
 *          Sequence numbers are carried from the frame, never interpreted.
 */

#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "relay/compat/expected.hpp"

namespace relay::proto {

/** @enum DecodeError
 *  @brief Why a datagram could not be decoded.
 */
enum class DecodeError : std::uint8_t {
    Empty = 1,         ///< Zero-length input
    BadMagic,          ///< First byte is not a v1/v2 start marker
    Truncated,         ///< Fewer bytes than the header declares
    ChecksumMismatch,  ///< CRC over header+payload+CRC_EXTRA disagrees
    UnknownMessage     ///< Id not in the catalogue (strict mode only)
};

/// Stable snake_case label, used in logs and the JSON `decode_error` field.
const char* to_string(DecodeError e) noexcept;

/// Decoded field value: integer, float, string (char[]), or numeric array.
using FieldValue = std::variant<std::int64_t,
                                std::uint64_t,
                                double,
                                std::string,
                                std::vector<std::int64_t>,
                                std::vector<std::uint64_t>,
                                std::vector<double>>;

/** @struct Field
 *  @brief One named payload value, kept in wire order.
 */
struct Field {
    std::string name;
    FieldValue  value;

    bool operator==(const Field&) const = default;
};

/** @struct DecodedMessage
 *  @brief Read-only metadata view over one received frame.
 */
struct DecodedMessage {
    std::uint32_t             msg_id{0};
    std::string               msg_name;          ///< Catalogue name or "UNKNOWN_<id>"
    std::uint8_t              system_id{0};
    std::uint8_t              component_id{0};
    std::uint8_t              seq{0};
    std::uint8_t              version{0};        ///< 1 or 2
    bool                      known{false};      ///< Found in the catalogue
    std::vector<Field>        fields;            ///< Empty for unknown ids
    std::vector<std::uint8_t> raw;               ///< The exact bytes decoded from

    bool operator==(const DecodedMessage&) const = default;
};

/** @struct DecodeOptions
 *  @brief Decoder knobs.
 */
struct DecodeOptions {
    bool strict{false}; ///< Reject ids missing from the catalogue
};

using DecodeResult = relay_detail::expected<DecodedMessage, DecodeError>;

/**
 * @brief Decode the first frame contained in @p bytes.
 * @param bytes Datagram bytes (trailing bytes after the first frame are ignored).
 * @param opts  Decoder options.
 * @return DecodedMessage, or the reason decoding failed.
 */
DecodeResult decode(std::span<const std::uint8_t> bytes, DecodeOptions opts = {});

} // namespace relay::proto
