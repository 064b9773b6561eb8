// =================================================================
// include/Feedlens/InferenceClient.hpp
// =================================================================
// Defines the interface for the remote text-analysis service.

#pragma once

#include <string>

namespace Feedlens {

/**
 * @brief Abstract interface for a remote inference backend
 *
 * Implementations send one prompt and return the raw, possibly malformed
 * response text. Failures are reported by throwing RemoteCallError or
 * QuotaExceededError.
 */
class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    /**
     * @brief Sends a prompt and returns the raw completion text.
     * @param prompt Task instruction plus the batch inputs.
     * @return Response text exactly as produced by the service.
     */
    virtual std::string getCompletion(const std::string& prompt) = 0;

    /**
     * @brief Identifier of the backing model, reported by status().
     */
    virtual std::string getClientId() const = 0;

    /**
     * @brief Whether the client has what it needs to make calls.
     */
    virtual bool isConfigured() const = 0;
};

} // namespace Feedlens
