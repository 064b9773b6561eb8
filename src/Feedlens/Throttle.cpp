// =================================================================
// src/Feedlens/Throttle.cpp
// =================================================================
// Implementation of the adaptive throttle.

#include "Feedlens/Throttle.hpp"
#include "Feedlens/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <thread>

namespace Feedlens {

Throttle::Throttle(const ThrottleConfig& config)
    : m_config(config),
      m_min_interval(std::clamp(config.initial_interval, config.floor, config.ceiling)) {}

std::chrono::milliseconds Throttle::waitIfNeeded() {
    auto delay = reserveDelay();
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    return delay;
}

std::chrono::milliseconds Throttle::reserveDelay() {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto now = Clock::now();
    Clock::time_point slot = now;
    if (m_has_request) {
        slot = std::max(now, m_last_request_time + m_min_interval);
    }
    
    m_last_request_time = slot;
    m_has_request = true;
    
    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(slot - now);
    m_total_wait_ms += static_cast<size_t>(delay.count());
    return delay;
}

void Throttle::adjust(CallOutcome outcome) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto before = m_min_interval;
    
    switch (outcome) {
        case CallOutcome::SUCCESS:
            m_consecutive_quota_errors = 0;
            if (!m_failed_since_adjust && m_min_interval > m_config.floor) {
                m_min_interval = clampInterval(m_min_interval.count() * m_config.ease_factor);
            }
            m_failed_since_adjust = false;
            break;
            
        case CallOutcome::FAILURE:
            m_min_interval = clampInterval(m_min_interval.count() * m_config.backoff_factor);
            m_failed_since_adjust = true;
            break;
            
        case CallOutcome::QUOTA_EXCEEDED: {
            m_min_interval = clampInterval(m_min_interval.count() * m_config.quota_backoff_factor);
            m_failed_since_adjust = true;
            m_consecutive_quota_errors++;
            
            double window = m_config.quota_cooldown_base.count() *
                            std::pow(2.0, static_cast<double>(m_consecutive_quota_errors - 1));
            window = std::min(window, static_cast<double>(m_config.quota_cooldown_cap.count()));
            m_rate_limited_until = Clock::now() + std::chrono::milliseconds(static_cast<long>(window * 1000.0));
            
            Logger::getInstance().warning("Throttle", "Rate limit exceeded, using local processing",
                "Window: " + std::to_string(static_cast<long>(window)) + "s");
            break;
        }
    }
    
    if (m_min_interval != before) {
        Logger::getInstance().debug("Throttle", "Interval adjusted",
            std::to_string(before.count()) + "ms -> " + std::to_string(m_min_interval.count()) + "ms");
    }
}

std::chrono::milliseconds Throttle::getMinInterval() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_min_interval;
}

bool Throttle::isRateLimited() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_consecutive_quota_errors > 0 && Clock::now() < m_rate_limited_until;
}

ThrottleSnapshot Throttle::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    ThrottleSnapshot snap;
    snap.min_interval = m_min_interval;
    snap.total_wait_ms = m_total_wait_ms;
    
    auto now = Clock::now();
    if (m_consecutive_quota_errors > 0 && now < m_rate_limited_until) {
        snap.rate_limited = true;
        snap.rate_limit_reset_in = std::chrono::duration_cast<std::chrono::milliseconds>(m_rate_limited_until - now);
    }
    
    return snap;
}

std::chrono::milliseconds Throttle::clampInterval(double interval_ms) const {
    auto interval = std::chrono::milliseconds(static_cast<long>(std::lround(interval_ms)));
    return std::clamp(interval, m_config.floor, m_config.ceiling);
}

} // namespace Feedlens
