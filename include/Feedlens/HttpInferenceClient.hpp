// =================================================================
// include/Feedlens/HttpInferenceClient.hpp
// =================================================================
// Defines the HTTP client for the remote text-analysis service.

#pragma once

#include "Feedlens/InferenceClient.hpp"
#include <chrono>
#include <string>

namespace Feedlens {

/**
 * @brief Connection settings for the remote inference service
 */
struct RemoteConfig {
    std::string server_url = "http://localhost:11434";
    std::string endpoint = "/api/generate";
    std::string model = "llama3:latest";
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds call_timeout{30000};     ///< Per-call limit, enforced by the orchestrator too
    size_t max_concurrency = 2;                         ///< Concurrent remote batches
    bool enabled = true;
};

class HttpInferenceClient : public InferenceClient {
public:
    /**
     * @brief Constructs the HTTP client.
     * @param config Server URL, endpoint, model and timeouts.
     */
    explicit HttpInferenceClient(const RemoteConfig& config);

    std::string getCompletion(const std::string& prompt) override;
    std::string getClientId() const override;
    bool isConfigured() const override;

    /**
     * @brief Serializes the generate request; invalid UTF-8 in the prompt is replaced, never rejected.
     */
    static std::string buildRequestBody(const std::string& model, const std::string& prompt);

    /**
     * @brief Extracts the completion text from a service response body.
     *
     * Reads the "response" field, or "text" when absent. Newline-delimited
     * chunks are concatenated. A body that is not JSON is returned as is.
     */
    static std::string extractCompletion(const std::string& body);

private:
    RemoteConfig m_config;
};

} // namespace Feedlens
