// =================================================================
// include/Feedlens/CircuitBreaker.hpp
// =================================================================
// Binary circuit breaker guarding the remote inference API.

#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace Feedlens {

/**
 * @brief Circuit breaker state
 */
enum class CircuitState {
    CLOSED,     ///< Remote calls permitted
    OPEN        ///< Remote calls bypassed until the reset deadline
};

/**
 * @brief Circuit breaker configuration
 */
struct CircuitBreakerConfig {
    unsigned failure_threshold = 3;                     ///< Failure weight that opens the circuit
    std::chrono::milliseconds reset_timeout{120000};    ///< How long the circuit stays open
    unsigned quota_failure_weight = 2;                  ///< Weight of a quota/rate failure
};

/**
 * @brief Point-in-time view of the breaker
 */
struct CircuitSnapshot {
    CircuitState state = CircuitState::CLOSED;
    unsigned consecutive_failures = 0;
    std::chrono::milliseconds reset_in{0};              ///< Time left until reset (0 when closed)
    size_t times_opened = 0;
};

/**
 * @brief Tracks consecutive remote failures and open/closed state over time
 *
 * Transitions are the only mutation path. When the reset deadline passes the
 * breaker closes outright; the next remote call acts as the trial and a new
 * run of failures re-opens it. Thread-safe.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    explicit CircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig());

    /**
     * @brief Check whether remote calls must be bypassed
     *
     * Performs the deadline check: an open circuit whose deadline has
     * passed transitions back to CLOSED and reports false.
     * @return True while the circuit is open
     */
    bool isOpen();

    /**
     * @brief Record a successful remote call; resets the failure count
     */
    void recordSuccess();

    /**
     * @brief Record a failed remote call
     * @param quota_exceeded Whether the failure was a quota/rate rejection
     */
    void recordFailure(bool quota_exceeded = false);

    /**
     * @brief Open the circuit immediately (operator override and tests)
     */
    void forceOpen();

    /**
     * @brief Return to CLOSED with no recorded failures
     */
    void reset();

    /**
     * @brief Read the state without performing the deadline transition
     */
    CircuitSnapshot snapshot() const;

    const CircuitBreakerConfig& getConfig() const { return m_config; }

    static std::string stateName(CircuitState state);

private:
    void openLocked(const std::string& reason);

    CircuitBreakerConfig m_config;
    CircuitState m_state = CircuitState::CLOSED;
    unsigned m_consecutive_failures = 0;
    Clock::time_point m_reset_deadline{};
    size_t m_times_opened = 0;
    mutable std::mutex m_mutex;
};

} // namespace Feedlens
