// =================================================================
// include/Feedlens/Throttle.hpp
// =================================================================
// Adaptive minimum-interval rate limiter for remote calls.

#pragma once

#include <chrono>
#include <mutex>

namespace Feedlens {

/**
 * @brief Outcome of a remote call, fed back into the throttle
 */
enum class CallOutcome {
    SUCCESS,
    FAILURE,
    QUOTA_EXCEEDED
};

/**
 * @brief Throttle configuration
 */
struct ThrottleConfig {
    std::chrono::milliseconds floor{100};           ///< Smallest allowed interval
    std::chrono::milliseconds ceiling{1000};        ///< Largest allowed interval
    std::chrono::milliseconds initial_interval{100};
    double backoff_factor = 1.5;                    ///< Interval multiplier on failure
    double quota_backoff_factor = 2.0;              ///< Interval multiplier on quota rejection
    double ease_factor = 0.9;                       ///< Interval multiplier on sustained success
    std::chrono::seconds quota_cooldown_base{5};    ///< First rate-limit window
    std::chrono::seconds quota_cooldown_cap{300};   ///< Longest rate-limit window
};

/**
 * @brief Point-in-time view of the throttle
 */
struct ThrottleSnapshot {
    std::chrono::milliseconds min_interval{0};
    bool rate_limited = false;
    std::chrono::milliseconds rate_limit_reset_in{0};
    size_t total_wait_ms = 0;
};

/**
 * @brief Self-tuning minimum-interval limiter
 *
 * Failures back the interval off multiplicatively up to the ceiling;
 * sustained success eases it back toward the floor. Quota rejections also
 * open a rate-limit window during which callers should avoid the remote API.
 */
class Throttle {
public:
    using Clock = std::chrono::steady_clock;

    explicit Throttle(const ThrottleConfig& config = ThrottleConfig());

    /**
     * @brief Block until min_interval has elapsed since the previous request
     *
     * Concurrent callers reserve consecutive slots, so they are spaced by
     * the interval rather than released together.
     * @return Time spent waiting
     */
    std::chrono::milliseconds waitIfNeeded();

    /**
     * @brief Reserve the next slot without sleeping
     * @return Delay the caller must honor before issuing its request
     */
    std::chrono::milliseconds reserveDelay();

    /**
     * @brief Adapt the interval to a call outcome
     */
    void adjust(CallOutcome outcome);

    std::chrono::milliseconds getMinInterval() const;

    /**
     * @brief Whether a quota rejection window is still active
     */
    bool isRateLimited() const;

    ThrottleSnapshot snapshot() const;

    const ThrottleConfig& getConfig() const { return m_config; }

private:
    std::chrono::milliseconds clampInterval(double interval_ms) const;

    ThrottleConfig m_config;
    std::chrono::milliseconds m_min_interval;
    Clock::time_point m_last_request_time{};
    bool m_has_request = false;
    bool m_failed_since_adjust = false;
    unsigned m_consecutive_quota_errors = 0;
    Clock::time_point m_rate_limited_until{};
    size_t m_total_wait_ms = 0;
    mutable std::mutex m_mutex;
};

} // namespace Feedlens
