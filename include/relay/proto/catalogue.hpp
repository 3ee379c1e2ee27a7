#pragma once
/**
 * @file catalogue.hpp
 * @brief Built-in subset of the MAVLink common message set.
 * @details Fields are listed in wire order (sorted by type size, as the generator
 *          emits them). Extension fields are not listed; bytes past the base
 *          payload are ignored by the decoder.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace relay::proto {

/** @enum FieldType
 *  @brief Wire type of one field (little-endian on the wire).
 */
enum class FieldType : std::uint8_t { U8, I8, U16, I16, U32, I32, U64, I64, F32, F64, Char };

/// Size in bytes of one element of @p t.
constexpr std::size_t type_size(FieldType t) noexcept {
    switch (t) {
        case FieldType::U8: case FieldType::I8: case FieldType::Char: return 1;
        case FieldType::U16: case FieldType::I16: return 2;
        case FieldType::U32: case FieldType::I32: case FieldType::F32: return 4;
        case FieldType::U64: case FieldType::I64: case FieldType::F64: return 8;
    }
    return 0;
}

/** @struct FieldSpec
 *  @brief One payload field. array_len == 0 means scalar.
 */
struct FieldSpec {
    const char*  name;
    FieldType    type;
    std::uint8_t array_len{0};

    /// Bytes this field occupies in the payload.
    constexpr std::size_t wire_size() const noexcept {
        return type_size(type) * (array_len == 0 ? 1 : array_len);
    }
};

/** @struct MessageSpec
 *  @brief Catalogue entry: id, name, checksum seed and field layout.
 */
struct MessageSpec {
    std::uint32_t              id;
    const char*                name;
    std::uint8_t               crc_extra;
    std::span<const FieldSpec> fields;

    /// Base payload length (sum of field sizes).
    std::size_t payload_length() const noexcept;
};

/// @return Catalogue entry for @p id, or nullptr when unknown.
const MessageSpec* find_message(std::uint32_t id) noexcept;

/// @return Catalogue entry named @p name (e.g. "HEARTBEAT"), or nullptr.
const MessageSpec* find_message(std::string_view name) noexcept;

/// @return Every known message, ordered by id.
std::span<const MessageSpec> catalogue() noexcept;

} // namespace relay::proto
