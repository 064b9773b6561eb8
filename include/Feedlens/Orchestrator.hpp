// =================================================================
// include/Feedlens/Orchestrator.hpp
// =================================================================
// Top-level coordinator for cached, throttled, fault-tolerant analysis.

#pragma once

#include "Feedlens/AnalysisTypes.hpp"
#include "Feedlens/BatchPlanner.hpp"
#include "Feedlens/CircuitBreaker.hpp"
#include "Feedlens/HttpInferenceClient.hpp"
#include "Feedlens/InferenceClient.hpp"
#include "Feedlens/LocalAnalyzer.hpp"
#include "Feedlens/Logger.hpp"
#include "Feedlens/ResponseParser.hpp"
#include "Feedlens/ResultCache.hpp"
#include "Feedlens/Throttle.hpp"
#include "Feedlens/WorkerPool.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Feedlens {

/**
 * @brief Which analyses may use the remote service and how much local parallelism to use
 */
struct RoutingConfig {
    bool remote_sentiment = false;      ///< Sentiment is local-only unless this is set
    size_t local_workers = 0;           ///< Local pool size (0 = hardware concurrency)
};

/**
 * @brief Complete orchestrator configuration
 */
struct OrchestratorConfig {
    CircuitBreakerConfig circuit;
    ThrottleConfig throttle;
    BatchPlannerConfig batching;
    ResultCacheConfig cache;
    RemoteConfig remote;
    RoutingConfig routing;
    LoggingConfig logging;
};

/**
 * @brief Process-wide counters, written only by the orchestrator
 */
struct Metrics {
    size_t requests = 0;
    size_t total_calls = 0;             ///< Remote call attempts
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    double average_latency_ms = 0.0;    ///< Running average over remote call attempts
    size_t remote_failures = 0;         ///< Calls that failed, timed out or were rejected
    size_t parse_failures = 0;          ///< Calls whose response could not be parsed or decoded
    size_t local_fallbacks = 0;         ///< Inputs served locally because the remote path was unusable
    size_t deadline_fallbacks = 0;      ///< Batches replaced locally after the submit deadline
};

/**
 * @brief Read-only health snapshot for monitoring
 */
struct StatusSnapshot {
    bool available = false;             ///< Remote path usable right now
    bool circuit_open = false;
    bool rate_limited = false;
    bool using_local_processing = true;
    double circuit_reset_in = 0.0;      ///< Seconds until the circuit closes
    double rate_limit_reset_in = 0.0;   ///< Seconds until the rate-limit window ends
    unsigned consecutive_failures = 0;
    long min_interval_ms = 0;
    std::string model;
    CacheStats cache_stats;
    Metrics metrics;
};

void to_json(nlohmann::json& j, const Metrics& metrics);
void to_json(nlohmann::json& j, const StatusSnapshot& status);

/**
 * @brief Routes analysis requests between the cache, the remote service and the local analyzer
 *
 * The orchestrator owns one instance of every resilience component and is
 * meant to be constructed once per process. submit() never surfaces remote
 * or parse failures: affected inputs are analyzed locally instead, and the
 * returned sequence always matches the input order and length.
 */
class Orchestrator {
public:
    /**
     * @brief Construct the orchestrator
     * @param config Component configuration
     * @param client Remote inference backend; null means local processing only
     */
    Orchestrator(const OrchestratorConfig& config, std::shared_ptr<InferenceClient> client);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Analyze every input of a request
     * @param request Inputs, kind and optional progress sink
     * @param timeout Optional deadline; batches still running at expiry are replaced by local results
     * @return One result per input, in input order
     * @throws LocalAnalysisError if no analysis path remains
     */
    std::vector<AnalysisResult> submit(const AnalysisRequest& request,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Health snapshot; performs no state transitions
     */
    StatusSnapshot status() const;

    Metrics getMetrics() const;

    CircuitBreaker& circuitBreaker() { return m_circuit; }
    Throttle& throttle() { return m_throttle; }
    ResultCache& cache() { return m_cache; }
    const OrchestratorConfig& getConfig() const { return m_config; }

private:
    /// Results for one batch, aligned with Batch::texts
    struct BatchOutcome {
        size_t batch_index = 0;
        std::vector<AnalysisResult> results;
        bool completed = false;         ///< False when the batch was skipped after the deadline
    };

    bool remoteEligible(AnalysisKind kind) const;
    std::optional<std::string> remoteUnavailableReason();

    BatchOutcome runRemoteBatch(const Batch& batch, AnalysisKind kind,
                                std::shared_ptr<std::atomic<bool>> abandoned);
    BatchOutcome runLocalBatch(const Batch& batch, AnalysisKind kind, const std::string& reason,
                               std::shared_ptr<std::atomic<bool>> abandoned);

    /**
     * @brief Analyze a batch locally
     * @param reason Why the remote path was not used, shown in degraded insight results
     * @param cache_results Whether local sentiment results are stored in the cache
     */
    std::vector<AnalysisResult> analyzeLocally(const std::vector<std::string>& texts, AnalysisKind kind,
                                               const std::string& reason, bool cache_results);

    bool decodeRemote(const std::string& raw, AnalysisKind kind, size_t expected,
                      std::vector<AnalysisResult>& out, std::string& error);

    /**
     * @brief Call the remote client, giving up after the configured call timeout
     * @throws RemoteCallError on failure or timeout
     */
    std::string callRemote(const std::string& prompt);

    void recordRemoteAttempt(long latency_ms);
    void recordCacheLookup(bool hit);
    void addLocalFallbacks(size_t count);

    OrchestratorConfig m_config;
    std::shared_ptr<InferenceClient> m_client;

    ResultCache m_cache;
    CircuitBreaker m_circuit;
    Throttle m_throttle;
    BatchPlanner m_planner;
    ResponseParser m_parser;
    LocalAnalyzer m_local;

    Metrics m_metrics;
    mutable std::mutex m_metrics_mutex;

    // Declared last so workers stop before the components they use
    std::unique_ptr<WorkerPool> m_local_pool;
    std::unique_ptr<WorkerPool> m_remote_pool;
};

} // namespace Feedlens
