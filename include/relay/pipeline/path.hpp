#pragma once
/**
 * @file path.hpp
 * @brief Identifiers of the three consumer paths fed by the fan-out router.
 */

#include <array>
#include <cstddef>
#include <cstdint>

namespace relay::pipeline {

/**
 * @enum Path
 * @brief One sink path. Values index per-path arrays.
 */
enum class Path : std::uint8_t {
    Publish = 0, ///< Raw bytes to downstream UDP endpoints
    Archive = 1, ///< Binary .tlog archive
    Jsonl   = 2  ///< Decoded JSON Lines log
};

inline constexpr std::size_t kPathCount = 3;

/// All paths in dispatch order.
inline constexpr std::array<Path, kPathCount> kAllPaths{Path::Publish, Path::Archive, Path::Jsonl};

/// Short label used in logs and thread names.
constexpr const char* to_string(Path p) noexcept {
    switch (p) {
        case Path::Publish: return "publish";
        case Path::Archive: return "archive";
        case Path::Jsonl:   return "jsonl";
    }
    return "unknown";
}

constexpr std::size_t index_of(Path p) noexcept { return static_cast<std::size_t>(p); }

} // namespace relay::pipeline
