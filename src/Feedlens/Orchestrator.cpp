// =================================================================
// src/Feedlens/Orchestrator.cpp
// =================================================================
// Implementation for cached, throttled, fault-tolerant analysis.

#include "Feedlens/Orchestrator.hpp"
#include "Feedlens/Errors.hpp"
#include "Feedlens/PromptBuilder.hpp"
#include <algorithm>
#include <future>
#include <thread>
#include <unordered_map>

namespace Feedlens {

namespace {

double toSeconds(std::chrono::milliseconds duration) {
    return static_cast<double>(duration.count()) / 1000.0;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const Metrics& metrics) {
    j = nlohmann::json{
        {"requests", metrics.requests},
        {"total_calls", metrics.total_calls},
        {"cache_hits", metrics.cache_hits},
        {"cache_misses", metrics.cache_misses},
        {"average_latency_ms", metrics.average_latency_ms},
        {"remote_failures", metrics.remote_failures},
        {"parse_failures", metrics.parse_failures},
        {"local_fallbacks", metrics.local_fallbacks},
        {"deadline_fallbacks", metrics.deadline_fallbacks}
    };
}

void to_json(nlohmann::json& j, const StatusSnapshot& status) {
    j = nlohmann::json{
        {"available", status.available},
        {"circuit_open", status.circuit_open},
        {"rate_limited", status.rate_limited},
        {"using_local_processing", status.using_local_processing},
        {"circuit_reset_in", status.circuit_reset_in},
        {"rate_limit_reset_in", status.rate_limit_reset_in},
        {"consecutive_failures", status.consecutive_failures},
        {"min_interval_ms", status.min_interval_ms},
        {"model", status.model},
        {"cache_stats", status.cache_stats},
        {"performance_metrics", status.metrics}
    };
}

Orchestrator::Orchestrator(const OrchestratorConfig& config, std::shared_ptr<InferenceClient> client)
    : m_config(config),
      m_client(std::move(client)),
      m_cache(config.cache),
      m_circuit(config.circuit),
      m_throttle(config.throttle),
      m_planner(config.batching) {
    size_t local_workers = m_config.routing.local_workers;
    if (local_workers == 0) {
        local_workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    size_t remote_workers = std::max<size_t>(1, m_config.remote.max_concurrency);

    m_local_pool = std::make_unique<WorkerPool>(local_workers, "local");
    m_remote_pool = std::make_unique<WorkerPool>(remote_workers, "remote");

    LOG_INFO("Orchestrator", "Initialized with " + std::to_string(local_workers) + " local workers, " +
             std::to_string(remote_workers) + " remote workers, remote client: " +
             (m_client ? m_client->getClientId() : std::string("none")));
}

Orchestrator::~Orchestrator() {
    // Join workers while every component is still alive
    m_remote_pool.reset();
    m_local_pool.reset();
}

std::vector<AnalysisResult> Orchestrator::submit(const AnalysisRequest& request,
                                                 std::optional<std::chrono::milliseconds> timeout) {
    auto start_time = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
        deadline = start_time + *timeout;
    }

    const size_t total_items = request.texts.size();
    const AnalysisKind kind = request.kind;

    {
        std::lock_guard<std::mutex> lock(m_metrics_mutex);
        m_metrics.requests++;
    }

    if (total_items == 0) {
        return {};
    }

    // Identical inputs share one lookup and one analysis
    std::vector<std::string> distinct_texts;
    std::vector<std::vector<size_t>> positions;
    std::unordered_map<std::string, size_t> distinct_index;
    for (size_t i = 0; i < total_items; ++i) {
        auto inserted = distinct_index.emplace(request.texts[i], distinct_texts.size());
        if (inserted.second) {
            distinct_texts.push_back(request.texts[i]);
            positions.emplace_back();
        }
        positions[inserted.first->second].push_back(i);
    }

    std::vector<std::optional<AnalysisResult>> results(total_items);
    auto scatter = [&](size_t distinct_id, const AnalysisResult& result) {
        for (size_t position : positions[distinct_id]) {
            results[position] = result;
        }
    };

    // 1. Cache lookup
    std::vector<std::string> miss_texts;
    std::vector<size_t> miss_ids;
    size_t items_processed = 0;
    for (size_t id = 0; id < distinct_texts.size(); ++id) {
        auto cached = m_cache.get(distinct_texts[id], kind);
        recordCacheLookup(cached.has_value());
        if (cached) {
            scatter(id, *cached);
            items_processed += positions[id].size();
        } else {
            miss_texts.push_back(distinct_texts[id]);
            miss_ids.push_back(id);
        }
    }

    LOG_DEBUG("Orchestrator", "Request for " + kindToString(kind) + ": " + std::to_string(total_items) +
              " inputs, " + std::to_string(miss_texts.size()) + " cache misses");

    if (miss_texts.empty()) {
        std::vector<AnalysisResult> ordered;
        ordered.reserve(total_items);
        for (auto& result : results) {
            ordered.push_back(std::move(*result));
        }
        return ordered;
    }

    // 2. Routing
    bool use_remote = false;
    std::string local_reason;
    if (!remoteEligible(kind)) {
        local_reason = (kind == AnalysisKind::SENTIMENT && !m_config.routing.remote_sentiment)
            ? "sentiment is analyzed locally"
            : "remote service not configured";
    } else if (auto reason = remoteUnavailableReason()) {
        local_reason = *reason;
        addLocalFallbacks(miss_texts.size());
    } else {
        use_remote = true;
    }

    // 3. Plan and dispatch
    std::vector<Batch> batches = m_planner.plan(miss_texts, miss_ids, use_remote ? BatchMode::REMOTE : BatchMode::LOCAL);
    auto abandoned = std::make_shared<std::atomic<bool>>(false);

    std::vector<std::future<BatchOutcome>> futures;
    futures.reserve(batches.size());
    for (const auto& batch : batches) {
        if (use_remote) {
            futures.push_back(m_remote_pool->enqueue(
                [this, batch, kind, abandoned]() { return runRemoteBatch(batch, kind, abandoned); }));
        } else {
            futures.push_back(m_local_pool->enqueue(
                [this, batch, kind, local_reason, abandoned]() {
                    return runLocalBatch(batch, kind, local_reason, abandoned);
                }));
        }
    }

    // 4. Collect in batch order and scatter by original index
    for (size_t b = 0; b < batches.size(); ++b) {
        const Batch& batch = batches[b];
        BatchOutcome outcome;

        bool ready = true;
        if (deadline) {
            ready = futures[b].wait_until(*deadline) == std::future_status::ready;
        }

        if (ready) {
            outcome = futures[b].get();
        }

        if (!ready || !outcome.completed) {
            abandoned->store(true);
            {
                std::lock_guard<std::mutex> lock(m_metrics_mutex);
                m_metrics.deadline_fallbacks++;
            }
            LOG_WARNING("Orchestrator", "Deadline expired before batch " + std::to_string(batch.batch_index) +
                        " completed, analyzing it locally");
            outcome.results = analyzeLocally(batch.texts, kind, "request deadline expired",
                                             kind == AnalysisKind::SENTIMENT);
            outcome.completed = true;
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            size_t id = batch.original_indices[i];
            scatter(id, outcome.results[i]);
            items_processed += positions[id].size();
        }

        ProgressEvent event;
        event.batches_done = b + 1;
        event.batches_total = batches.size();
        event.items_processed = items_processed;
        event.items_total = total_items;
        Logger::getInstance().logBatchProgress(event.batches_done, event.batches_total,
                                               event.items_processed, event.items_total);
        if (request.progress) {
            try {
                request.progress(event);
            } catch (const std::exception& e) {
                LOG_WARNING("Orchestrator", "Progress sink failed: " + std::string(e.what()));
            }
        }
    }

    std::vector<AnalysisResult> ordered;
    ordered.reserve(total_items);
    for (size_t i = 0; i < total_items; ++i) {
        if (!results[i]) {
            throw LocalAnalysisError("No result produced for input " + std::to_string(i));
        }
        ordered.push_back(std::move(*results[i]));
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    LOG_INFO("Orchestrator", "Completed " + kindToString(kind) + " request: " + std::to_string(total_items) +
             " inputs, " + std::to_string(batches.size()) + " batches in " + std::to_string(duration.count()) + "ms");

    return ordered;
}

StatusSnapshot Orchestrator::status() const {
    StatusSnapshot snap;

    CircuitSnapshot circuit = m_circuit.snapshot();
    ThrottleSnapshot throttle = m_throttle.snapshot();

    snap.circuit_open = circuit.state == CircuitState::OPEN && circuit.reset_in.count() > 0;
    snap.rate_limited = throttle.rate_limited;
    snap.circuit_reset_in = snap.circuit_open ? toSeconds(circuit.reset_in) : 0.0;
    snap.rate_limit_reset_in = toSeconds(throttle.rate_limit_reset_in);
    snap.consecutive_failures = circuit.consecutive_failures;
    snap.min_interval_ms = static_cast<long>(throttle.min_interval.count());

    bool configured = m_client && m_client->isConfigured();
    snap.model = m_client ? m_client->getClientId() : "";
    snap.available = configured && !snap.circuit_open && !snap.rate_limited;
    snap.using_local_processing = !snap.available;

    snap.cache_stats = m_cache.stats();
    snap.metrics = getMetrics();

    return snap;
}

Metrics Orchestrator::getMetrics() const {
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    return m_metrics;
}

bool Orchestrator::remoteEligible(AnalysisKind kind) const {
    if (!m_client || !m_client->isConfigured()) {
        return false;
    }
    return kind != AnalysisKind::SENTIMENT || m_config.routing.remote_sentiment;
}

std::optional<std::string> Orchestrator::remoteUnavailableReason() {
    if (m_circuit.isOpen()) {
        return std::string("circuit breaker open");
    }
    if (m_throttle.isRateLimited()) {
        return std::string("remote service rate limited");
    }
    return std::nullopt;
}

Orchestrator::BatchOutcome Orchestrator::runRemoteBatch(const Batch& batch, AnalysisKind kind,
                                                        std::shared_ptr<std::atomic<bool>> abandoned) {
    BatchOutcome outcome;
    outcome.batch_index = batch.batch_index;

    if (abandoned->load()) {
        return outcome;
    }

    // The circuit may have opened while this batch was queued
    if (auto reason = remoteUnavailableReason()) {
        addLocalFallbacks(batch.size());
        outcome.results = analyzeLocally(batch.texts, kind, *reason, kind == AnalysisKind::SENTIMENT);
        outcome.completed = true;
        return outcome;
    }

    m_throttle.waitIfNeeded();

    std::string prompt = PromptBuilder::build(kind, batch.texts);
    std::string failure_reason;
    bool quota_exceeded = false;
    std::string raw;

    auto call_start = std::chrono::steady_clock::now();
    try {
        raw = callRemote(prompt);
    } catch (const RemoteCallError& e) {
        failure_reason = e.isTimeout() ? "remote call timed out" : "remote call failed";
        quota_exceeded = e.isQuotaExceeded();
        LOG_WARNING("Orchestrator", "Remote call for batch " + std::to_string(batch.batch_index) +
                    " failed: " + std::string(e.what()));
    } catch (const std::exception& e) {
        failure_reason = "remote call failed";
        LOG_ERROR("Orchestrator", "Unexpected error from remote client for batch " +
                  std::to_string(batch.batch_index) + ": " + std::string(e.what()));
    }
    long latency_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - call_start).count());
    recordRemoteAttempt(latency_ms);

    if (failure_reason.empty()) {
        std::string decode_error;
        bool decoded = false;
        try {
            decoded = decodeRemote(raw, kind, batch.size(), outcome.results, decode_error);
        } catch (const nlohmann::json::exception& e) {
            decode_error = "Malformed response payload: " + std::string(e.what());
        }
        if (decoded) {
            m_circuit.recordSuccess();
            m_throttle.adjust(CallOutcome::SUCCESS);
            Logger::getInstance().logRemoteCall(batch.size(), raw.size(), latency_ms, true);

            for (size_t i = 0; i < batch.size(); ++i) {
                m_cache.put(batch.texts[i], outcome.results[i], kind);
            }
            outcome.completed = true;
            return outcome;
        }

        failure_reason = "remote response could not be parsed";
        {
            std::lock_guard<std::mutex> lock(m_metrics_mutex);
            m_metrics.parse_failures++;
        }
        LOG_WARNING("Orchestrator", "Batch " + std::to_string(batch.batch_index) + ": " + decode_error);
    } else {
        std::lock_guard<std::mutex> lock(m_metrics_mutex);
        m_metrics.remote_failures++;
    }

    Logger::getInstance().logRemoteCall(batch.size(), raw.size(), latency_ms, false);
    m_circuit.recordFailure(quota_exceeded);
    m_throttle.adjust(quota_exceeded ? CallOutcome::QUOTA_EXCEEDED : CallOutcome::FAILURE);

    if (quota_exceeded) {
        failure_reason = "remote quota exceeded";
    }

    addLocalFallbacks(batch.size());
    outcome.results = analyzeLocally(batch.texts, kind, failure_reason, kind == AnalysisKind::SENTIMENT);
    outcome.completed = true;
    return outcome;
}

Orchestrator::BatchOutcome Orchestrator::runLocalBatch(const Batch& batch, AnalysisKind kind,
                                                       const std::string& reason,
                                                       std::shared_ptr<std::atomic<bool>> abandoned) {
    BatchOutcome outcome;
    outcome.batch_index = batch.batch_index;

    if (abandoned->load()) {
        return outcome;
    }

    outcome.results = analyzeLocally(batch.texts, kind, reason, kind == AnalysisKind::SENTIMENT);
    outcome.completed = true;
    return outcome;
}

std::vector<AnalysisResult> Orchestrator::analyzeLocally(const std::vector<std::string>& texts, AnalysisKind kind,
                                                         const std::string& reason, bool cache_results) {
    std::vector<AnalysisResult> results;
    results.reserve(texts.size());

    if (kind != AnalysisKind::SENTIMENT) {
        // No local equivalent; degraded results are never cached
        InsightResult degraded = LocalAnalyzer::degradedInsight(reason);
        for (size_t i = 0; i < texts.size(); ++i) {
            results.push_back(AnalysisResult::fromInsight(kind, degraded, ResultSource::DEGRADED));
        }
        return results;
    }

    try {
        for (const auto& text : texts) {
            results.push_back(m_local.analyze(text));
        }
    } catch (const std::exception& e) {
        LOG_CRITICAL("Orchestrator", "Local analysis failed: " + std::string(e.what()));
        throw LocalAnalysisError("Local analysis failed: " + std::string(e.what()));
    }

    if (cache_results) {
        for (size_t i = 0; i < texts.size(); ++i) {
            m_cache.put(texts[i], results[i], kind);
        }
    }

    return results;
}

bool Orchestrator::decodeRemote(const std::string& raw, AnalysisKind kind, size_t expected,
                                std::vector<AnalysisResult>& out, std::string& error) {
    out.clear();

    ParseResult parsed = m_parser.parse(raw);
    if (!parsed.success) {
        error = "Unparseable response after " + std::to_string(parsed.error.attempts) +
                " attempts: " + parsed.error.message;
        return false;
    }

    if (kind == AnalysisKind::SENTIMENT) {
        std::vector<SentimentResult> sentiments;
        if (!m_parser.decodeSentiments(parsed.records, expected, sentiments, error)) {
            return false;
        }
        for (const auto& sentiment : sentiments) {
            out.push_back(AnalysisResult::fromSentiment(sentiment, ResultSource::REMOTE));
        }
        return true;
    }

    std::vector<InsightResult> insights;
    if (!m_parser.decodeInsights(parsed.records, expected, insights, error)) {
        return false;
    }
    for (const auto& insight : insights) {
        out.push_back(AnalysisResult::fromInsight(kind, insight, ResultSource::REMOTE));
    }
    return true;
}

std::string Orchestrator::callRemote(const std::string& prompt) {
    if (!m_client) {
        throw RemoteCallError("No remote client configured");
    }

    // The call runs on its own thread so a hung client cannot hold this worker
    // past the timeout. It keeps the client alive through its own shared_ptr.
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> result = promise->get_future();
    std::shared_ptr<InferenceClient> client = m_client;

    std::thread([client, prompt, promise]() {
        try {
            promise->set_value(client->getCompletion(prompt));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(m_config.remote.call_timeout) != std::future_status::ready) {
        throw RemoteCallError("Remote call timed out after " +
                              std::to_string(m_config.remote.call_timeout.count()) + "ms", 0, true);
    }

    return result.get();
}

void Orchestrator::recordRemoteAttempt(long latency_ms) {
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    m_metrics.total_calls++;
    m_metrics.average_latency_ms +=
        (static_cast<double>(latency_ms) - m_metrics.average_latency_ms) / static_cast<double>(m_metrics.total_calls);
}

void Orchestrator::recordCacheLookup(bool hit) {
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    if (hit) {
        m_metrics.cache_hits++;
    } else {
        m_metrics.cache_misses++;
    }
}

void Orchestrator::addLocalFallbacks(size_t count) {
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    m_metrics.local_fallbacks += count;
}

} // namespace Feedlens
