// =================================================================
// tests/OrchestratorTest.cpp
// =================================================================
// Unit tests for Orchestrator routing, fallback and caching behavior.

#include "Feedlens/Orchestrator.hpp"
#include "Feedlens/Errors.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <functional>
#include <sstream>
#include <thread>

using namespace Feedlens;
using std::chrono::milliseconds;

namespace {

/**
 * @brief Test double whose responses are produced by a handler
 */
class ScriptedClient : public InferenceClient {
public:
    using Handler = std::function<std::string(const std::vector<std::string>& reviews)>;

    explicit ScriptedClient(Handler handler) : m_handler(std::move(handler)) {}

    std::string getCompletion(const std::string& prompt) override {
        m_calls++;
        return m_handler(reviewsIn(prompt));
    }

    std::string getClientId() const override { return "scripted-model"; }
    bool isConfigured() const override { return true; }

    size_t calls() const { return m_calls.load(); }

    static std::vector<std::string> reviewsIn(const std::string& prompt) {
        std::vector<std::string> reviews;
        std::istringstream stream(prompt);
        std::string line;
        while (std::getline(stream, line)) {
            if (line.rfind("Review ", 0) == 0) {
                size_t colon = line.find(": ");
                if (colon != std::string::npos) {
                    reviews.push_back(line.substr(colon + 2));
                }
            }
        }
        return reviews;
    }

private:
    Handler m_handler;
    std::atomic<size_t> m_calls{0};
};

// Fenced insight array with one record per review
std::string echoInsights(const std::vector<std::string>& reviews) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& review : reviews) {
        records.push_back({
            {"summary", "S:" + review},
            {"key_points", {review}},
            {"pain_points", nlohmann::json::array()},
            {"feature_requests", nlohmann::json::array()},
            {"positive_aspects", nlohmann::json::array()}
        });
    }
    return "```json\n" + records.dump() + "\n```";
}

size_t itemNumber(const std::string& text) {
    return static_cast<size_t>(std::stoul(text.substr(text.find('-') + 1)));
}

std::vector<std::string> numberedItems(size_t count) {
    std::vector<std::string> items;
    for (size_t i = 0; i < count; ++i) {
        items.push_back("item-" + std::to_string(i));
    }
    return items;
}

} // anonymous namespace

class OrchestratorTest {
private:
    static OrchestratorConfig fastConfig() {
        OrchestratorConfig config;
        config.throttle.floor = milliseconds(1);
        config.throttle.initial_interval = milliseconds(1);
        config.throttle.ceiling = milliseconds(20);
        config.throttle.quota_cooldown_base = std::chrono::seconds(1);
        config.throttle.quota_cooldown_cap = std::chrono::seconds(2);
        config.remote.call_timeout = milliseconds(2000);
        config.remote.max_concurrency = 2;
        config.routing.local_workers = 2;
        return config;
    }

    static AnalysisRequest makeRequest(const std::vector<std::string>& texts, AnalysisKind kind) {
        AnalysisRequest request;
        request.texts = texts;
        request.kind = kind;
        return request;
    }

public:
    OrchestratorTest() {
        Logger::getInstance().setFileLogging(false);
        Logger::getInstance().setConsoleLogLevel(LogLevel::CRITICAL);
    }

    void testFallbackCompleteness() {
        std::cout << "Testing fallback completeness with the circuit forced open..." << std::endl;

        auto client = std::make_shared<ScriptedClient>(echoInsights);
        OrchestratorConfig config = fastConfig();
        config.routing.remote_sentiment = true;
        Orchestrator orchestrator(config, client);
        orchestrator.circuitBreaker().forceOpen();

        std::vector<std::string> texts;
        for (int i = 0; i < 50; ++i) {
            texts.push_back("review " + std::to_string(i) + (i % 2 ? " is great" : " keeps crashing"));
        }

        auto results = orchestrator.submit(makeRequest(texts, AnalysisKind::SENTIMENT));

        assert(results.size() == 50 && "Every input should get a result");
        for (const auto& result : results) {
            assert(result.isSentiment() && "Sentiment request yields sentiment results");
            assert(result.source == ResultSource::LOCAL && "Results should come from the local analyzer");
            assert(result.sentiment().score >= 0.0 && result.sentiment().score <= 1.0 && "Score in range");
        }
        assert(client->calls() == 0 && "No remote call may be attempted while the circuit is open");
        assert(orchestrator.getMetrics().total_calls == 0 && "Metrics should show no remote calls");
        assert(orchestrator.getMetrics().local_fallbacks == 50 && "All inputs were served by fallback");

        auto insights = orchestrator.submit(makeRequest(texts, AnalysisKind::INSIGHT));
        assert(insights.size() == 50 && "Insight request should also be complete");
        for (const auto& result : insights) {
            assert(result.source == ResultSource::DEGRADED && "Insights degrade without the remote path");
            assert(result.insight().key_points.empty() && "Degraded insight lists are empty");
        }
        assert(client->calls() == 0 && "Still no remote calls");

        std::cout << "✓ Fallback completeness test passed" << std::endl;
    }

    void testScenarioRemoteUnavailable() {
        std::cout << "Testing scenario: remote unavailable for sentiment..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>&) -> std::string {
            throw RemoteCallError("Failed to reach inference server: Connection", 0);
        });
        OrchestratorConfig config = fastConfig();
        config.routing.remote_sentiment = true;
        Orchestrator orchestrator(config, client);

        std::vector<std::string> texts = {"great app", "crashes constantly", "meh, ok"};
        std::vector<AnalysisResult> first;
        bool threw = false;
        try {
            first = orchestrator.submit(makeRequest(texts, AnalysisKind::SENTIMENT));
        } catch (const std::exception&) {
            threw = true;
        }

        assert(!threw && "Remote failure must not surface to the caller");
        assert(first.size() == 3 && "Should return three results");
        assert(first[0].sentiment().label == SentimentLabel::POSITIVE && "First should be positive");
        assert(first[1].sentiment().label == SentimentLabel::NEGATIVE && "Second should be negative");
        assert(first[2].sentiment().label == SentimentLabel::NEUTRAL && "Third should be neutral");

        Metrics metrics = orchestrator.getMetrics();
        assert(metrics.cache_misses == 3 && "All three inputs should miss");
        assert(metrics.total_calls == 1 && "One remote batch should be attempted");
        assert(metrics.remote_failures == 1 && "The failure should be counted");
        assert(orchestrator.status().consecutive_failures == 1 && "Circuit should see the failure");

        auto second = orchestrator.submit(makeRequest(texts, AnalysisKind::SENTIMENT));
        assert(orchestrator.getMetrics().cache_hits == 3 && "Second call should hit the cache three times");
        assert(second == first && "Cached results should be identical");
        assert(client->calls() == 1 && "Cached inputs need no remote call");

        std::cout << "✓ Scenario test passed" << std::endl;
    }

    void testSentimentStaysLocalByDefault() {
        std::cout << "Testing sentiment routing policy..." << std::endl;

        auto client = std::make_shared<ScriptedClient>(echoInsights);
        Orchestrator orchestrator(fastConfig(), client);

        auto results = orchestrator.submit(makeRequest({"great app", "crashes constantly"}, AnalysisKind::SENTIMENT));
        assert(results.size() == 2 && "Should return two results");
        assert(results[0].source == ResultSource::LOCAL && "Sentiment should be local by default");
        assert(client->calls() == 0 && "Sentiment must not consume remote quota by default");
        assert(orchestrator.getMetrics().local_fallbacks == 0 && "Policy routing is not a fallback");

        std::cout << "✓ Sentiment routing test passed" << std::endl;
    }

    void testRemoteSentimentDecoding() {
        std::cout << "Testing remote sentiment results..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>& reviews) {
            nlohmann::json records = nlohmann::json::array();
            for (size_t i = 0; i < reviews.size(); ++i) {
                records.push_back({{"score", 0.8}, {"label", "POSITIVE"}, {"confidence", 0.6}});
            }
            return "Here is the analysis: " + records.dump() + " Thanks!";
        });
        OrchestratorConfig config = fastConfig();
        config.routing.remote_sentiment = true;
        Orchestrator orchestrator(config, client);

        auto results = orchestrator.submit(makeRequest({"fine", "ok", "sure"}, AnalysisKind::SENTIMENT));
        assert(results.size() == 3 && "Should return three results");
        for (const auto& result : results) {
            assert(result.source == ResultSource::REMOTE && "Results should come from the remote path");
            assert(result.sentiment().score == 0.8 && result.sentiment().confidence == 0.6 && "Values should be decoded");
        }
        assert(client->calls() == 1 && "Three short inputs fit in one batch");
        assert(orchestrator.getMetrics().average_latency_ms >= 0.0 && "Latency should be tracked");

        std::cout << "✓ Remote sentiment test passed" << std::endl;
    }

    void testOrderPreservation() {
        std::cout << "Testing order preservation across cache, remote and fallback..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>& reviews) {
            for (const auto& review : reviews) {
                if (review == "item-40") {
                    throw RemoteCallError("Inference server returned error status: 500", 500);
                }
            }
            // Earlier batches answer later
            std::this_thread::sleep_for(milliseconds(itemNumber(reviews.front()) < 10 ? 120 : 10));
            return echoInsights(reviews);
        });
        Orchestrator orchestrator(fastConfig(), client);

        assert(orchestrator.submit(makeRequest({}, AnalysisKind::INSIGHT)).empty() && "Empty request gives no results");

        auto all = numberedItems(45);
        std::vector<std::string> warm(all.begin() + 5, all.begin() + 10);
        orchestrator.submit(makeRequest(warm, AnalysisKind::INSIGHT));

        auto results = orchestrator.submit(makeRequest(all, AnalysisKind::INSIGHT));
        assert(results.size() == all.size() && "Result count should equal input count");

        size_t degraded = 0;
        for (size_t i = 0; i < results.size(); ++i) {
            if (results[i].source == ResultSource::DEGRADED) {
                degraded++;
                continue;
            }
            assert(results[i].source == ResultSource::REMOTE && "Non-degraded results are remote");
            assert(results[i].insight().summary == "S:" + all[i] && "Result i must belong to input i");
        }

        assert(results[40].source == ResultSource::DEGRADED && "The failing batch should fall back");
        assert(degraded == 20 && "Exactly the failing batch should be degraded");
        for (size_t i = 0; i < 10; ++i) {
            assert(results[i].source == ResultSource::REMOTE && "Cached and successful inputs stay remote");
        }

        std::cout << "✓ Order preservation test passed" << std::endl;
    }

    void testCacheIdempotence() {
        std::cout << "Testing cache idempotence..." << std::endl;

        auto client = std::make_shared<ScriptedClient>(echoInsights);
        Orchestrator orchestrator(fastConfig(), client);

        std::vector<std::string> texts = {"slow sync", "love the widgets", "slow sync", "needs dark mode"};

        auto first = orchestrator.submit(makeRequest(texts, AnalysisKind::INSIGHT));
        Metrics after_first = orchestrator.getMetrics();
        assert(after_first.cache_misses == 3 && "Duplicates share one lookup");
        assert(first[0] == first[2] && "Duplicate inputs get identical results");

        auto second = orchestrator.submit(makeRequest(texts, AnalysisKind::INSIGHT));
        Metrics after_second = orchestrator.getMetrics();

        assert(second == first && "Second submit should return identical results");
        assert(after_second.cache_hits - after_first.cache_hits == 3 &&
               "Hits should grow by the number of distinct inputs");
        assert(client->calls() == 1 && "Second submit should not call the remote service");

        auto summaries = orchestrator.submit(makeRequest({"slow sync"}, AnalysisKind::SUMMARY));
        assert(summaries[0].kind == AnalysisKind::SUMMARY && "Summary kind uses its own partition");
        assert(client->calls() == 2 && "Summary partition is independent of insight");

        std::cout << "✓ Cache idempotence test passed" << std::endl;
    }

    void testParseFailuresOpenCircuit() {
        std::cout << "Testing parse failures feed the circuit breaker..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>&) {
            return std::string("Sorry, I cannot analyze these reviews right now.");
        });
        Orchestrator orchestrator(fastConfig(), client);

        for (int i = 0; i < 3; ++i) {
            auto results = orchestrator.submit(makeRequest({"text " + std::to_string(i)}, AnalysisKind::INSIGHT));
            assert(results.size() == 1 && results[0].source == ResultSource::DEGRADED && "Parse failure should degrade");
        }

        StatusSnapshot status = orchestrator.status();
        assert(status.circuit_open && "Three failures should open the circuit");
        assert(!status.available && status.using_local_processing && "Status should report local processing");
        assert(status.circuit_reset_in > 0.0 && "Status should report time to reset");
        assert(status.min_interval_ms > 1 && "Throttle should have backed off");

        auto results = orchestrator.submit(makeRequest({"text 3"}, AnalysisKind::INSIGHT));
        assert(client->calls() == 3 && "Open circuit should bypass the remote service");
        assert(results[0].insight().summary.find("circuit breaker open") != std::string::npos &&
               "Degraded summary should explain why");

        Metrics metrics = orchestrator.getMetrics();
        assert(metrics.parse_failures == 3 && "Parse failures should be counted");
        assert(metrics.total_calls == 3 && "Only three calls were attempted");

        std::cout << "✓ Parse failure test passed" << std::endl;
    }

    void testOverflowingNumberDegrades() {
        std::cout << "Testing responses with out-of-range numbers..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>&) {
            return std::string("[{\"summary\": \"x\", \"score\": 1e999}]");
        });
        Orchestrator orchestrator(fastConfig(), client);

        std::vector<AnalysisResult> results;
        bool threw = false;
        try {
            results = orchestrator.submit(makeRequest({"great app"}, AnalysisKind::INSIGHT));
        } catch (const std::exception&) {
            threw = true;
        }

        assert(!threw && "A malformed payload must not surface to the caller");
        assert(results.size() == 1 && results[0].source == ResultSource::DEGRADED && "Batch should fall back");
        assert(orchestrator.getMetrics().parse_failures == 1 && "Overflow counts as a parse failure");
        assert(orchestrator.status().consecutive_failures == 1 && "Overflow should feed the breaker");

        std::cout << "✓ Out-of-range number test passed" << std::endl;
    }

    void testQuotaErrorRateLimits() {
        std::cout << "Testing quota errors..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>&) -> std::string {
            throwRemoteFailure(429, "Too Many Requests");
            return "";
        });
        Orchestrator orchestrator(fastConfig(), client);

        auto results = orchestrator.submit(makeRequest({"first"}, AnalysisKind::INSIGHT));
        assert(results[0].source == ResultSource::DEGRADED && "Quota failure should degrade");

        StatusSnapshot status = orchestrator.status();
        assert(status.rate_limited && "Quota error should rate limit");
        assert(status.rate_limit_reset_in > 0.0 && "Status should report the window");
        assert(status.consecutive_failures == 2 && "Quota failure should weigh 2");
        assert(!status.circuit_open && "Weight 2 is below the threshold");
        assert(!status.available && "Remote is unavailable while rate limited");

        auto next = orchestrator.submit(makeRequest({"second"}, AnalysisKind::INSIGHT));
        assert(client->calls() == 1 && "Rate-limited window should route locally");
        assert(next[0].insight().summary.find("rate limited") != std::string::npos && "Summary should explain");

        std::cout << "✓ Quota test passed" << std::endl;
    }

    void testSubmitDeadline() {
        std::cout << "Testing submit deadline..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>& reviews) {
            std::this_thread::sleep_for(milliseconds(600));
            return echoInsights(reviews);
        });
        Orchestrator orchestrator(fastConfig(), client);

        auto start = std::chrono::steady_clock::now();
        auto results = orchestrator.submit(makeRequest({"a", "b", "c"}, AnalysisKind::INSIGHT), milliseconds(100));
        auto elapsed = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start);

        assert(elapsed < milliseconds(500) && "Submit must stop waiting at the deadline");
        assert(results.size() == 3 && "Deadline must not drop results");
        for (const auto& result : results) {
            assert(result.source == ResultSource::DEGRADED && "Late batch should be replaced locally");
            assert(result.insight().summary.find("deadline") != std::string::npos && "Summary should explain");
        }
        assert(orchestrator.getMetrics().deadline_fallbacks == 1 && "Deadline fallback should be counted");

        std::cout << "✓ Deadline test passed" << std::endl;
    }

    void testRemoteCallTimeout() {
        std::cout << "Testing per-call timeout..." << std::endl;

        auto client = std::make_shared<ScriptedClient>([](const std::vector<std::string>& reviews) {
            std::this_thread::sleep_for(milliseconds(400));
            return echoInsights(reviews);
        });
        OrchestratorConfig config = fastConfig();
        config.remote.call_timeout = milliseconds(100);

        {
            Orchestrator orchestrator(config, client);

            auto start = std::chrono::steady_clock::now();
            auto results = orchestrator.submit(makeRequest({"slow"}, AnalysisKind::INSIGHT));
            auto elapsed = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start);

            assert(elapsed < milliseconds(350) && "Timed-out call should not be awaited");
            assert(results[0].source == ResultSource::DEGRADED && "Timeout should fall back");
            assert(orchestrator.getMetrics().remote_failures == 1 && "Timeout counts as a remote failure");
            assert(orchestrator.status().consecutive_failures == 1 && "Timeout should feed the breaker");
        }

        // Let the abandoned call finish before the next test
        std::this_thread::sleep_for(milliseconds(400));

        std::cout << "✓ Call timeout test passed" << std::endl;
    }

    void testProgressEvents() {
        std::cout << "Testing progress events..." << std::endl;

        OrchestratorConfig config = fastConfig();
        config.batching.local_batch_sizes = {{2, 2, 2, 2}};
        Orchestrator orchestrator(config, nullptr);

        std::vector<ProgressEvent> events;
        AnalysisRequest request = makeRequest({"one", "two", "three", "four", "five"}, AnalysisKind::SENTIMENT);
        request.progress = [&events](const ProgressEvent& event) { events.push_back(event); };

        auto results = orchestrator.submit(request);
        assert(results.size() == 5 && "Should return five results");
        assert(events.size() == 3 && "Five inputs in batches of two give three events");
        for (size_t i = 0; i < events.size(); ++i) {
            assert(events[i].batches_done == i + 1 && "Events arrive in batch order");
            assert(events[i].batches_total == 3 && "Total batch count is reported");
            assert(events[i].items_total == 5 && "Total item count is reported");
        }
        assert(events.back().items_processed == 5 && "Last event covers every input");

        std::cout << "✓ Progress events test passed" << std::endl;
    }

    void testStatusSnapshot() {
        std::cout << "Testing status snapshot..." << std::endl;

        auto client = std::make_shared<ScriptedClient>(echoInsights);
        Orchestrator orchestrator(fastConfig(), client);

        StatusSnapshot status = orchestrator.status();
        assert(status.available && !status.circuit_open && !status.rate_limited && "Fresh orchestrator is healthy");
        assert(status.model == "scripted-model" && "Model id should be reported");

        nlohmann::json j = status;
        assert(j.contains("available") && j.contains("circuit_open") && j.contains("rate_limited") &&
               j.contains("cache_stats") && j.contains("performance_metrics") && "JSON should carry every field");
        assert(j["performance_metrics"].contains("average_latency_ms") && "Metrics should be serialized");

        Orchestrator local_only(fastConfig(), nullptr);
        StatusSnapshot local_status = local_only.status();
        assert(!local_status.available && local_status.using_local_processing && "No client means local processing");

        std::cout << "✓ Status snapshot test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Orchestrator unit tests..." << std::endl;

        testFallbackCompleteness();
        testScenarioRemoteUnavailable();
        testSentimentStaysLocalByDefault();
        testRemoteSentimentDecoding();
        testOrderPreservation();
        testCacheIdempotence();
        testParseFailuresOpenCircuit();
        testOverflowingNumberDegrades();
        testQuotaErrorRateLimits();
        testSubmitDeadline();
        testRemoteCallTimeout();
        testProgressEvents();
        testStatusSnapshot();

        std::cout << "All Orchestrator tests passed!" << std::endl;
    }
};

int main() {
    try {
        OrchestratorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Orchestrator component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
