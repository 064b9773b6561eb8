// =================================================================
// src/Feedlens/HttpInferenceClient.cpp
// =================================================================
// Implementation for the HTTP client of the remote text-analysis service.

#include "Feedlens/HttpInferenceClient.hpp"
#include "Feedlens/Errors.hpp"
#include "Feedlens/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <sstream>

namespace Feedlens {

namespace {

void splitTimeout(std::chrono::milliseconds timeout, time_t& sec, time_t& usec) {
    sec = static_cast<time_t>(timeout.count() / 1000);
    usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
}

} // anonymous namespace

HttpInferenceClient::HttpInferenceClient(const RemoteConfig& config)
    : m_config(config) {
    LOG_INFO("HttpInferenceClient", "Configured client for server: " + m_config.server_url +
             " with model: " + m_config.model);
}

std::string HttpInferenceClient::getCompletion(const std::string& prompt) {
    if (!isConfigured()) {
        throw RemoteCallError("Remote inference client is not configured");
    }
    
    // The httplib constructor handles URL parsing automatically.
    httplib::Client client(m_config.server_url.c_str());
    
    time_t sec = 0;
    time_t usec = 0;
    splitTimeout(m_config.connect_timeout, sec, usec);
    client.set_connection_timeout(sec, usec);
    splitTimeout(m_config.call_timeout, sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
    
    httplib::Headers headers = {{"Content-Type", "application/json"}};
    
    auto res = client.Post(
        m_config.endpoint.c_str(),
        headers,
        buildRequestBody(m_config.model, prompt),
        "application/json"
    );
    
    if (!res) {
        auto error = res.error();
        std::string message = "Failed to reach inference server at " + m_config.server_url +
                              ": " + httplib::to_string(error);
        bool timeout = (error == httplib::Error::Read || error == httplib::Error::Write);
        throw RemoteCallError(message, 0, timeout);
    }
    
    if (res->status < 200 || res->status >= 300) {
        throwRemoteFailure(res->status, "Inference server returned error status: " +
                           std::to_string(res->status) + " - " + res->body);
    }
    
    return extractCompletion(res->body);
}

std::string HttpInferenceClient::getClientId() const {
    return m_config.model;
}

bool HttpInferenceClient::isConfigured() const {
    return m_config.enabled && !m_config.server_url.empty() && !m_config.model.empty();
}

std::string HttpInferenceClient::buildRequestBody(const std::string& model, const std::string& prompt) {
    nlohmann::json request_body = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false}
    };
    
    // Inputs are not guaranteed to be UTF-8; invalid bytes become U+FFFD
    return request_body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string HttpInferenceClient::extractCompletion(const std::string& body) {
    auto read_chunk = [](const nlohmann::json& chunk, std::string& out) {
        if (!chunk.is_object()) {
            return false;
        }
        for (const char* field : {"response", "text"}) {
            auto it = chunk.find(field);
            if (it != chunk.end() && it->is_string()) {
                out += it->get<std::string>();
                return true;
            }
        }
        return false;
    };
    
    std::string completion;
    
    nlohmann::json whole = nlohmann::json::parse(body, nullptr, false);
    if (!whole.is_discarded()) {
        if (read_chunk(whole, completion)) {
            return completion;
        }
        if (whole.is_object() && whole.contains("error")) {
            std::string message = whole["error"].is_string() ? whole["error"].get<std::string>()
                                                             : whole["error"].dump();
            throwRemoteFailure(0, "Inference server reported an error: " + message);
        }
        return body;
    }
    
    // Newline-delimited JSON chunks
    std::istringstream response_stream(body);
    std::string line;
    bool any_chunk = false;
    while (std::getline(response_stream, line)) {
        if (line.empty()) continue;
        nlohmann::json chunk = nlohmann::json::parse(line, nullptr, false);
        if (!chunk.is_discarded() && read_chunk(chunk, completion)) {
            any_chunk = true;
        }
    }
    
    return any_chunk ? completion : body;
}

} // namespace Feedlens
