#pragma once
/**
 * @file ingress_listener.hpp
 * @brief Upstream receive loop policy: retry transport errors, detect unreachable upstream.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "relay/compat/expected.hpp"
#include "relay/mem/raw_frame.hpp"
#include "relay/net/frame_source.hpp"
#include "relay/obs/observability.hpp"

namespace relay::net {

/**
 * @enum IngressFault
 * @brief Unrecoverable ingress condition reported to the relay.
 */
enum class IngressFault : std::uint8_t {
    UpstreamUnreachable = 1  ///< Too many consecutive receive failures within the window
};

/**
 * @struct IngressPolicy
 * @brief When do receive failures stop being transient.
 */
struct IngressPolicy {
    std::uint32_t             max_consecutive_errors{3};
    std::chrono::milliseconds error_window{1000};
};

/**
 * @class IngressListener
 * @brief Pulls frames from a FrameSource and applies the failure policy.
 *
 * A successful receive clears the failure streak. A timeout leaves it as is.
 * A failure that arrives after the window since the streak began starts a new streak.
 */
class IngressListener {
public:
    IngressListener(std::unique_ptr<FrameSource> source, IngressPolicy policy,
                    obs::IngressCounters& counters) noexcept;

    /**
     * @brief Receive the next frame.
     * @return Frame; std::nullopt after a timeout or a tolerated error;
     *         IngressFault::UpstreamUnreachable once the policy trips.
     */
    relay_detail::expected<std::optional<mem::RawFrame>, IngressFault> next();

    /// Current number of consecutive failures.
    std::uint32_t error_streak() const noexcept { return streak_; }

    /// Description of the underlying source.
    std::string describe() const { return source_->describe(); }

private:
    std::unique_ptr<FrameSource>           source_;
    IngressPolicy                          policy_;
    obs::IngressCounters&                  counters_;
    std::uint32_t                          streak_{0};
    std::chrono::steady_clock::time_point  streak_start_{};
};

} // namespace relay::net
