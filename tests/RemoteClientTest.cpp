// =================================================================
// tests/RemoteClientTest.cpp
// =================================================================
// Unit tests for remote failure classification and the HTTP client.

#include "Feedlens/HttpInferenceClient.hpp"
#include "Feedlens/Errors.hpp"
#include "Feedlens/Logger.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <cassert>

using namespace Feedlens;

class RemoteClientTest {
public:
    RemoteClientTest() {
        Logger::getInstance().setFileLogging(false);
        Logger::getInstance().setConsoleLogLevel(LogLevel::CRITICAL);
    }

    void testQuotaDetection() {
        std::cout << "Testing quota failure detection..." << std::endl;

        assert(isQuotaFailure(429, "") && "Status 429 is a quota failure");
        assert(isQuotaFailure(0, "Quota exceeded for project") && "Quota message detected");
        assert(isQuotaFailure(0, "Rate limit reached") && "Rate message detected");
        assert(isQuotaFailure(500, "upstream said 429") && "429 in message detected");
        assert(!isQuotaFailure(500, "failed to generate completion") && "'generate' is not a rate message");
        assert(!isQuotaFailure(503, "Service Unavailable") && "Plain server errors are not quota failures");

        std::cout << "✓ Quota detection test passed" << std::endl;
    }

    void testFailureClassification() {
        std::cout << "Testing failure classification..." << std::endl;

        auto quota = classifyRemoteFailure(0, "rate limit");
        assert(quota->isQuotaExceeded() && "Rate message should classify as quota");
        assert(quota->getStatus() == 429 && "Quota without status defaults to 429");

        auto plain = classifyRemoteFailure(500, "Internal Server Error");
        assert(!plain->isQuotaExceeded() && "Server error is a plain failure");
        assert(plain->getStatus() == 500 && "Status should be kept");

        bool caught_quota = false;
        try {
            throwRemoteFailure(429, "Too Many Requests");
        } catch (const RemoteCallError& e) {
            caught_quota = e.isQuotaExceeded();
        }
        assert(caught_quota && "Thrown quota error should keep its type");

        bool caught_plain = false;
        try {
            throwRemoteFailure(502, "Bad Gateway");
        } catch (const QuotaExceededError&) {
            assert(false && "Bad gateway is not a quota error");
        } catch (const RemoteCallError& e) {
            caught_plain = e.getStatus() == 502 && !e.isTimeout();
        }
        assert(caught_plain && "Plain remote error should be thrown");

        std::cout << "✓ Failure classification test passed" << std::endl;
    }

    void testExtractCompletion() {
        std::cout << "Testing completion extraction..." << std::endl;

        assert(HttpInferenceClient::extractCompletion(R"({"response": "[1, 2]"})") == "[1, 2]" &&
               "Should read the response field");
        assert(HttpInferenceClient::extractCompletion(R"({"text": "hello"})") == "hello" &&
               "Should fall back to the text field");
        assert(HttpInferenceClient::extractCompletion("{\"response\": \"ab\"}\n{\"response\": \"cd\"}\n") == "abcd" &&
               "Streamed chunks should be concatenated");
        assert(HttpInferenceClient::extractCompletion("plain words") == "plain words" &&
               "Non-JSON bodies are returned unchanged");

        bool quota = false;
        try {
            HttpInferenceClient::extractCompletion(R"({"error": "quota exhausted"})");
        } catch (const RemoteCallError& e) {
            quota = e.isQuotaExceeded();
        }
        assert(quota && "Error payload mentioning quota should raise a quota error");

        std::cout << "✓ Completion extraction test passed" << std::endl;
    }

    void testRequestBodyWithInvalidUtf8() {
        std::cout << "Testing request body with non-UTF-8 input..." << std::endl;

        // Latin-1 encoded "café"
        std::string prompt = "Review 1: caf\xe9 crashes";

        std::string body;
        bool threw = false;
        try {
            body = HttpInferenceClient::buildRequestBody("test-model", prompt);
        } catch (const std::exception&) {
            threw = true;
        }
        assert(!threw && "Invalid UTF-8 must not prevent building the request");

        nlohmann::json request = nlohmann::json::parse(body);
        assert(request["model"] == "test-model" && "Model should be sent");
        assert(request["stream"] == false && "Streaming should be off");
        std::string sent = request["prompt"].get<std::string>();
        assert(sent == "Review 1: caf\xEF\xBF\xBD crashes" && "Invalid byte should become a replacement character");

        std::cout << "✓ Non-UTF-8 request body test passed" << std::endl;
    }

    void testClientConfiguration() {
        std::cout << "Testing client configuration..." << std::endl;

        RemoteConfig config;
        config.model = "test-model";
        HttpInferenceClient client(config);
        assert(client.isConfigured() && "Default settings are usable");
        assert(client.getClientId() == "test-model" && "Client id is the model name");

        RemoteConfig disabled;
        disabled.enabled = false;
        HttpInferenceClient disabled_client(disabled);
        assert(!disabled_client.isConfigured() && "Disabled client is not configured");

        bool threw = false;
        try {
            disabled_client.getCompletion("prompt");
        } catch (const RemoteCallError&) {
            threw = true;
        }
        assert(threw && "Unconfigured client should refuse to call");

        std::cout << "✓ Client configuration test passed" << std::endl;
    }

    void testUnreachableServer() {
        std::cout << "Testing unreachable server..." << std::endl;

        RemoteConfig config;
        config.server_url = "http://127.0.0.1:1";
        config.connect_timeout = std::chrono::milliseconds(500);
        config.call_timeout = std::chrono::milliseconds(500);
        HttpInferenceClient client(config);

        bool threw = false;
        try {
            client.getCompletion("Review 1: caf\xe9 crashes");
        } catch (const RemoteCallError& e) {
            threw = e.getStatus() == 0;
        }
        assert(threw && "Connection failure should raise a remote error without status");

        std::cout << "✓ Unreachable server test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running remote client unit tests..." << std::endl;

        testQuotaDetection();
        testFailureClassification();
        testExtractCompletion();
        testRequestBodyWithInvalidUtf8();
        testClientConfiguration();
        testUnreachableServer();

        std::cout << "All remote client tests passed!" << std::endl;
    }
};

int main() {
    try {
        RemoteClientTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All remote client component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
