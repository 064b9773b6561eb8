// =================================================================
// include/Feedlens/ResultCache.hpp
// =================================================================
// Bounded, partitioned LRU cache for analysis results.

#pragma once

#include "Feedlens/AnalysisTypes.hpp"
#include <string>
#include <list>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include <optional>

namespace Feedlens {

/**
 * @brief Cache configuration
 */
struct ResultCacheConfig {
    size_t sentiment_capacity = 1000;             ///< Max entries in the sentiment partition
    size_t insight_capacity = 1000;               ///< Max entries in the insight partition
    size_t summary_capacity = 1000;               ///< Max entries in the summary partition
    size_t long_text_threshold = 1000;            ///< Texts longer than this get a hashed key
    size_t key_prefix_length = 100;               ///< Prefix kept in hashed keys
    std::chrono::seconds ttl{0};                  ///< Entry freshness limit (0 = no expiry)
};

/**
 * @brief Per-partition occupancy
 */
struct PartitionStats {
    size_t size = 0;
    size_t capacity = 0;
    size_t evictions = 0;
};

/**
 * @brief Cache statistics snapshot
 */
struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    PartitionStats sentiment;
    PartitionStats insight;
    PartitionStats summary;

    double hitRate() const {
        size_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / total;
    }
};

void to_json(nlohmann::json& j, const CacheStats& stats);

/**
 * @brief Multi-partition LRU cache keyed by input text
 *
 * One partition exists per AnalysisKind so eviction pressure in one kind
 * never displaces entries of another. Reads refresh recency. All operations
 * are thread-safe.
 */
class ResultCache {
public:
    explicit ResultCache(const ResultCacheConfig& config = ResultCacheConfig());

    /**
     * @brief Look up a cached result
     * @param text Input text
     * @param partition Analysis kind whose partition is searched
     * @return Cached result, or nullopt on a miss
     */
    std::optional<AnalysisResult> get(const std::string& text, AnalysisKind partition);

    /**
     * @brief Insert or refresh a result, evicting the least recently used entry on overflow
     */
    void put(const std::string& text, const AnalysisResult& result, AnalysisKind partition);

    CacheStats stats() const;

    void clear();

    /**
     * @brief Derive the storage key for a text
     *
     * Texts up to the long-text threshold are their own key. Longer texts
     * use the first key_prefix_length characters, "_" and a content hash.
     */
    std::string makeKey(const std::string& text) const;

private:
    struct Entry {
        std::string key;
        AnalysisResult value;
        std::chrono::steady_clock::time_point last_access;
        std::chrono::steady_clock::time_point inserted_at;
        AnalysisKind partition;
    };

    struct Partition {
        std::list<Entry> entries;                 ///< Most recently used first
        std::unordered_map<std::string, std::list<Entry>::iterator> index;
        size_t capacity = 0;
        size_t evictions = 0;
    };

    Partition& partitionFor(AnalysisKind kind);
    const Partition& partitionFor(AnalysisKind kind) const;
    bool isExpired(const Entry& entry, std::chrono::steady_clock::time_point now) const;
    static PartitionStats statsFor(const Partition& partition);

    ResultCacheConfig m_config;
    Partition m_sentiment;
    Partition m_insight;
    Partition m_summary;
    size_t m_hits = 0;
    size_t m_misses = 0;
    mutable std::mutex m_mutex;
};

} // namespace Feedlens
