// =================================================================
// src/Feedlens/ResultCache.cpp
// =================================================================
// Implementation of the partitioned LRU result cache.

#include "Feedlens/ResultCache.hpp"
#include "Feedlens/Logger.hpp"
#include <functional>
#include <sstream>
#include <iomanip>

namespace Feedlens {

void to_json(nlohmann::json& j, const CacheStats& stats) {
    auto partition = [](const PartitionStats& p) {
        return nlohmann::json{{"size", p.size}, {"capacity", p.capacity}, {"evictions", p.evictions}};
    };
    j = nlohmann::json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hit_rate", stats.hitRate()},
        {"sentiment", partition(stats.sentiment)},
        {"insight", partition(stats.insight)},
        {"summary", partition(stats.summary)}
    };
}

ResultCache::ResultCache(const ResultCacheConfig& config) : m_config(config) {
    m_sentiment.capacity = config.sentiment_capacity;
    m_insight.capacity = config.insight_capacity;
    m_summary.capacity = config.summary_capacity;
}

std::optional<AnalysisResult> ResultCache::get(const std::string& text, AnalysisKind partition) {
    std::string key = makeKey(text);
    auto now = std::chrono::steady_clock::now();
    
    std::lock_guard<std::mutex> lock(m_mutex);
    Partition& part = partitionFor(partition);
    
    auto it = part.index.find(key);
    if (it == part.index.end()) {
        m_misses++;
        return std::nullopt;
    }
    
    if (isExpired(*it->second, now)) {
        part.entries.erase(it->second);
        part.index.erase(it);
        m_misses++;
        return std::nullopt;
    }
    
    // Move to front: access refreshes recency
    part.entries.splice(part.entries.begin(), part.entries, it->second);
    it->second->last_access = now;
    m_hits++;
    
    return it->second->value;
}

void ResultCache::put(const std::string& text, const AnalysisResult& result, AnalysisKind partition) {
    std::string key = makeKey(text);
    auto now = std::chrono::steady_clock::now();
    
    std::lock_guard<std::mutex> lock(m_mutex);
    Partition& part = partitionFor(partition);
    
    if (part.capacity == 0) {
        return;
    }
    
    auto it = part.index.find(key);
    if (it != part.index.end()) {
        it->second->value = result;
        it->second->last_access = now;
        it->second->inserted_at = now;
        part.entries.splice(part.entries.begin(), part.entries, it->second);
        return;
    }
    
    part.entries.push_front(Entry{key, result, now, now, partition});
    part.index[key] = part.entries.begin();
    
    while (part.entries.size() > part.capacity) {
        const Entry& oldest = part.entries.back();
        part.index.erase(oldest.key);
        part.entries.pop_back();
        part.evictions++;
    }
}

CacheStats ResultCache::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    CacheStats stats;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.sentiment = statsFor(m_sentiment);
    stats.insight = statsFor(m_insight);
    stats.summary = statsFor(m_summary);
    return stats;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (Partition* part : {&m_sentiment, &m_insight, &m_summary}) {
        part->entries.clear();
        part->index.clear();
    }
    LOG_DEBUG("ResultCache", "All partitions cleared");
}

std::string ResultCache::makeKey(const std::string& text) const {
    if (text.size() <= m_config.long_text_threshold) {
        return text;
    }
    
    std::hash<std::string> hasher;
    std::ostringstream key;
    key << text.substr(0, m_config.key_prefix_length) << "_"
        << std::hex << std::setw(16) << std::setfill('0') << hasher(text);
    return key.str();
}

ResultCache::Partition& ResultCache::partitionFor(AnalysisKind kind) {
    switch (kind) {
        case AnalysisKind::INSIGHT: return m_insight;
        case AnalysisKind::SUMMARY: return m_summary;
        case AnalysisKind::SENTIMENT:
        default: return m_sentiment;
    }
}

const ResultCache::Partition& ResultCache::partitionFor(AnalysisKind kind) const {
    switch (kind) {
        case AnalysisKind::INSIGHT: return m_insight;
        case AnalysisKind::SUMMARY: return m_summary;
        case AnalysisKind::SENTIMENT:
        default: return m_sentiment;
    }
}

bool ResultCache::isExpired(const Entry& entry, std::chrono::steady_clock::time_point now) const {
    if (m_config.ttl.count() <= 0) {
        return false;
    }
    return now - entry.inserted_at >= m_config.ttl;
}

PartitionStats ResultCache::statsFor(const Partition& partition) {
    PartitionStats stats;
    stats.size = partition.entries.size();
    stats.capacity = partition.capacity;
    stats.evictions = partition.evictions;
    return stats;
}

} // namespace Feedlens
