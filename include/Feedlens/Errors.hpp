// =================================================================
// include/Feedlens/Errors.hpp
// =================================================================
// Error types raised by the remote path, configuration and local analysis.

#pragma once

#include <stdexcept>
#include <string>
#include <memory>

namespace Feedlens {

/**
 * @brief Failure of a remote inference call (network, timeout, non-2xx)
 */
class RemoteCallError : public std::runtime_error {
public:
    RemoteCallError(const std::string& message, int status = 0, bool timeout = false)
        : std::runtime_error(message), m_status(status), m_timeout(timeout) {}

    /**
     * @brief HTTP status of the failed call, 0 when no response was received
     */
    int getStatus() const { return m_status; }

    bool isTimeout() const { return m_timeout; }

    /**
     * @brief Whether this failure is a quota or rate-limit rejection
     */
    virtual bool isQuotaExceeded() const { return false; }

private:
    int m_status;
    bool m_timeout;
};

/**
 * @brief Remote rejection caused by quota exhaustion or rate limiting
 */
class QuotaExceededError : public RemoteCallError {
public:
    explicit QuotaExceededError(const std::string& message, int status = 429)
        : RemoteCallError(message, status) {}

    bool isQuotaExceeded() const override { return true; }
};

/**
 * @brief Unreadable or inconsistent configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Failure of the local analysis path; no analysis path remains
 */
class LocalAnalysisError : public std::runtime_error {
public:
    explicit LocalAnalysisError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Check whether a status or message identifies a quota/rate rejection
 * @param status HTTP status (0 if none)
 * @param message Error message or response body
 * @return True for status 429 or a message mentioning "429", "quota" or "rate"
 */
bool isQuotaFailure(int status, const std::string& message);

/**
 * @brief Build the matching error type for a failed remote call
 * @param status HTTP status (0 if none)
 * @param message Error message or response body
 * @return QuotaExceededError or RemoteCallError
 */
std::unique_ptr<RemoteCallError> classifyRemoteFailure(int status, const std::string& message);

/**
 * @brief Throw the error classifyRemoteFailure selects, preserving its dynamic type
 */
void throwRemoteFailure(int status, const std::string& message);

} // namespace Feedlens
