#pragma once
/**
 * @file frame_sink.hpp
 * @brief Consumer end of one path: what a SinkWorker hands its frames to.
 * @details A sink is owned by exactly one worker thread and is never touched
 *          from anywhere else while that worker runs.
 */

#include <cstdint>
#include <string>

#include "relay/mem/raw_frame.hpp"

namespace relay::sink {

    /// @brief Result of a sink operation.
    enum class SinkStatus : std::uint8_t {
        Ok = 0,  ///< Done (or a tolerated per-item failure, already logged)
        Failed   ///< Unrecoverable; the worker fail-stops this path
    };

    /** @struct OpenError
     *  @brief Why a sink could not be created at startup.
     */
    struct OpenError {
        std::string message;
    };

    class FrameSink {
    public:
        virtual ~FrameSink() = default;

        /// Short label for logs (e.g. file path or endpoint list).
        virtual std::string describe() const = 0;

        /// Write one frame as one complete record.
        virtual SinkStatus write(const mem::RawFrame& frame) = 0;

        /// Push buffered records to the OS.
        virtual SinkStatus flush() = 0;

        /// Release the underlying handle. Idempotent.
        virtual void close() noexcept = 0;
    };

} // namespace relay::sink
