// =================================================================
// tests/ResultCacheTest.cpp
// =================================================================
// Unit tests for ResultCache component.

#include "Feedlens/ResultCache.hpp"
#include "Feedlens/Logger.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

using namespace Feedlens;

class ResultCacheTest {
private:
    static AnalysisResult sentiment(double score) {
        SentimentResult s;
        s.score = score;
        s.label = score > 0.5 ? SentimentLabel::POSITIVE : SentimentLabel::NEGATIVE;
        s.confidence = 0.8;
        return AnalysisResult::fromSentiment(s, ResultSource::LOCAL);
    }

    static AnalysisResult insight(const std::string& summary) {
        InsightResult i;
        i.summary = summary;
        i.key_points = {"point"};
        return AnalysisResult::fromInsight(AnalysisKind::INSIGHT, i, ResultSource::REMOTE);
    }

public:
    ResultCacheTest() {
        Logger::getInstance().setFileLogging(false);
        Logger::getInstance().setConsoleLogLevel(LogLevel::ERROR);
    }

    void testGetPutAndAccounting() {
        std::cout << "Testing get/put and hit/miss accounting..." << std::endl;
        
        ResultCache cache;
        
        assert(!cache.get("great app", AnalysisKind::SENTIMENT) && "Empty cache should miss");
        
        cache.put("great app", sentiment(0.9), AnalysisKind::SENTIMENT);
        auto hit = cache.get("great app", AnalysisKind::SENTIMENT);
        assert(hit && "Stored entry should be returned");
        assert(*hit == sentiment(0.9) && "Returned value should equal stored value");
        
        auto stats = cache.stats();
        assert(stats.hits == 1 && "Should count one hit");
        assert(stats.misses == 1 && "Should count one miss");
        assert(stats.sentiment.size == 1 && "Sentiment partition should hold one entry");
        assert(stats.hitRate() == 0.5 && "Hit rate should be 0.5");
        
        std::cout << "✓ Get/put accounting test passed" << std::endl;
    }
    
    void testPartitionsAreIndependent() {
        std::cout << "Testing partition independence..." << std::endl;
        
        ResultCacheConfig config;
        config.sentiment_capacity = 2;
        config.insight_capacity = 2;
        ResultCache cache(config);
        
        cache.put("shared text", insight("insight summary"), AnalysisKind::INSIGHT);
        assert(!cache.get("shared text", AnalysisKind::SENTIMENT) && "Insight entry must not leak into sentiment");
        assert(!cache.get("shared text", AnalysisKind::SUMMARY) && "Insight entry must not leak into summary");
        
        // Fill sentiment well past capacity
        for (int i = 0; i < 10; ++i) {
            cache.put("text " + std::to_string(i), sentiment(0.1), AnalysisKind::SENTIMENT);
        }
        
        assert(cache.get("shared text", AnalysisKind::INSIGHT) && "Sentiment pressure must not evict insight entries");
        
        auto stats = cache.stats();
        assert(stats.sentiment.size == 2 && "Sentiment partition should be bounded by capacity");
        assert(stats.sentiment.evictions == 8 && "Should record 8 evictions");
        assert(stats.insight.size == 1 && "Insight partition should be untouched");
        
        std::cout << "✓ Partition independence test passed" << std::endl;
    }
    
    void testLeastRecentlyAccessedEviction() {
        std::cout << "Testing LRU eviction refreshed by access..." << std::endl;
        
        ResultCacheConfig config;
        config.sentiment_capacity = 3;
        ResultCache cache(config);
        
        cache.put("a", sentiment(0.1), AnalysisKind::SENTIMENT);
        cache.put("b", sentiment(0.2), AnalysisKind::SENTIMENT);
        cache.put("c", sentiment(0.3), AnalysisKind::SENTIMENT);
        
        // Access "a" so "b" becomes the oldest
        assert(cache.get("a", AnalysisKind::SENTIMENT) && "a should be cached");
        
        cache.put("d", sentiment(0.4), AnalysisKind::SENTIMENT);
        
        assert(cache.get("a", AnalysisKind::SENTIMENT) && "Recently accessed entry should survive");
        assert(!cache.get("b", AnalysisKind::SENTIMENT) && "Least recently accessed entry should be evicted");
        assert(cache.get("c", AnalysisKind::SENTIMENT) && "c should survive");
        assert(cache.get("d", AnalysisKind::SENTIMENT) && "Newest entry should be present");
        
        std::cout << "✓ LRU eviction test passed" << std::endl;
    }
    
    void testKeyDerivation() {
        std::cout << "Testing key derivation for long texts..." << std::endl;
        
        ResultCache cache;
        
        std::string short_text(1000, 'x');
        assert(cache.makeKey(short_text) == short_text && "Texts up to the threshold are their own key");
        
        std::string long_a(1500, 'y');
        std::string long_b = long_a;
        long_b[1400] = 'z';
        
        std::string key_a = cache.makeKey(long_a);
        std::string key_b = cache.makeKey(long_b);
        
        assert(key_a.size() < long_a.size() && "Long texts should get a bounded key");
        assert(key_a.compare(0, 100, long_a, 0, 100) == 0 && "Key should start with the first 100 characters");
        assert(key_a[100] == '_' && "Prefix and hash should be separated by an underscore");
        assert(key_a != key_b && "Texts sharing a prefix should get different keys");
        assert(cache.makeKey(long_a) == key_a && "Key derivation should be deterministic");
        
        cache.put(long_a, sentiment(0.7), AnalysisKind::SENTIMENT);
        assert(cache.get(long_a, AnalysisKind::SENTIMENT) && "Long text should be retrievable");
        assert(!cache.get(long_b, AnalysisKind::SENTIMENT) && "Similar long text should not collide");
        
        std::cout << "✓ Key derivation test passed" << std::endl;
    }
    
    void testOverwriteAndClear() {
        std::cout << "Testing overwrite and clear..." << std::endl;
        
        ResultCache cache;
        cache.put("same", sentiment(0.2), AnalysisKind::SENTIMENT);
        cache.put("same", sentiment(0.8), AnalysisKind::SENTIMENT);
        
        auto value = cache.get("same", AnalysisKind::SENTIMENT);
        assert(value && value->sentiment().score == 0.8 && "Second put should overwrite");
        assert(cache.stats().sentiment.size == 1 && "Overwrite should not add an entry");
        
        cache.clear();
        assert(cache.stats().sentiment.size == 0 && "Clear should empty partitions");
        assert(!cache.get("same", AnalysisKind::SENTIMENT) && "Cleared entry should miss");
        
        std::cout << "✓ Overwrite and clear test passed" << std::endl;
    }
    
    void testTtlExpiry() {
        std::cout << "Testing optional TTL expiry..." << std::endl;
        
        ResultCacheConfig config;
        config.ttl = std::chrono::seconds(1);
        ResultCache cache(config);
        
        cache.put("fresh", sentiment(0.6), AnalysisKind::SENTIMENT);
        assert(cache.get("fresh", AnalysisKind::SENTIMENT) && "Entry should be fresh immediately");
        
        std::this_thread::sleep_for(std::chrono::milliseconds(1100));
        assert(!cache.get("fresh", AnalysisKind::SENTIMENT) && "Entry should expire after the TTL");
        assert(cache.stats().sentiment.size == 0 && "Expired entry should be removed");
        
        std::cout << "✓ TTL expiry test passed" << std::endl;
    }
    
    void testConcurrentAccess() {
        std::cout << "Testing concurrent access..." << std::endl;
        
        ResultCacheConfig config;
        config.sentiment_capacity = 50;
        ResultCache cache(config);
        
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&cache, t]() {
                for (int i = 0; i < 200; ++i) {
                    std::string text = "t" + std::to_string(t) + "_" + std::to_string(i % 30);
                    if (!cache.get(text, AnalysisKind::SENTIMENT)) {
                        cache.put(text, sentiment(0.5), AnalysisKind::SENTIMENT);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        
        auto stats = cache.stats();
        assert(stats.hits + stats.misses == 800 && "Every lookup should be counted exactly once");
        assert(stats.sentiment.size <= 50 && "Capacity must hold under concurrency");
        
        std::cout << "✓ Concurrent access test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "Running ResultCache unit tests..." << std::endl;
        
        testGetPutAndAccounting();
        testPartitionsAreIndependent();
        testLeastRecentlyAccessedEviction();
        testKeyDerivation();
        testOverwriteAndClear();
        testTtlExpiry();
        testConcurrentAccess();
        
        std::cout << "All ResultCache tests passed!" << std::endl;
    }
};

int main() {
    try {
        ResultCacheTest tests;
        tests.runAllTests();
        
        std::cout << "\n🎉 All ResultCache component tests passed!" << std::endl;
        return 0;
        
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
