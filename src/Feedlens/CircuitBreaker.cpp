// =================================================================
// src/Feedlens/CircuitBreaker.cpp
// =================================================================
// Implementation of the binary circuit breaker.

#include "Feedlens/CircuitBreaker.hpp"
#include "Feedlens/Logger.hpp"

namespace Feedlens {

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config) : m_config(config) {}

bool CircuitBreaker::isOpen() {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    if (m_state == CircuitState::CLOSED) {
        return false;
    }
    
    auto now = Clock::now();
    if (now >= m_reset_deadline) {
        m_state = CircuitState::CLOSED;
        m_consecutive_failures = 0;
        Logger::getInstance().logCircuitTransition("OPEN", "CLOSED", "Reset timeout elapsed, next remote call is the trial");
        return false;
    }
    
    return true;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consecutive_failures = 0;
}

void CircuitBreaker::recordFailure(bool quota_exceeded) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    m_consecutive_failures += quota_exceeded ? m_config.quota_failure_weight : 1;
    
    if (m_state == CircuitState::CLOSED && m_consecutive_failures >= m_config.failure_threshold) {
        openLocked("Consecutive failures: " + std::to_string(m_consecutive_failures));
    }
}

void CircuitBreaker::forceOpen() {
    std::lock_guard<std::mutex> lock(m_mutex);
    openLocked("Forced open");
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == CircuitState::OPEN) {
        Logger::getInstance().logCircuitTransition("OPEN", "CLOSED", "Manual reset");
    }
    m_state = CircuitState::CLOSED;
    m_consecutive_failures = 0;
}

CircuitSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    CircuitSnapshot snap;
    snap.state = m_state;
    snap.consecutive_failures = m_consecutive_failures;
    snap.times_opened = m_times_opened;
    
    if (m_state == CircuitState::OPEN) {
        auto now = Clock::now();
        if (now < m_reset_deadline) {
            snap.reset_in = std::chrono::duration_cast<std::chrono::milliseconds>(m_reset_deadline - now);
        }
    }
    
    return snap;
}

std::string CircuitBreaker::stateName(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        default: return "UNKNOWN";
    }
}

void CircuitBreaker::openLocked(const std::string& reason) {
    std::string from = stateName(m_state);
    m_state = CircuitState::OPEN;
    m_reset_deadline = Clock::now() + m_config.reset_timeout;
    m_times_opened++;
    Logger::getInstance().logCircuitTransition(from, "OPEN",
        reason + ", bypassing remote for " + std::to_string(m_config.reset_timeout.count()) + "ms");
}

} // namespace Feedlens
