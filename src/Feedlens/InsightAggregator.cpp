// =================================================================
// src/Feedlens/InsightAggregator.cpp
// =================================================================
// Implementation for merging per-input insights into one collection-level record.

#include "Feedlens/InsightAggregator.hpp"
#include <algorithm>

namespace Feedlens {

InsightResult InsightAggregator::combine(const std::vector<AnalysisResult>& results, size_t limit) {
    std::vector<std::string> summaries;
    std::vector<std::string> key_points, pain_points, feature_requests, positive_aspects;
    
    for (const auto& result : results) {
        if (result.isSentiment()) {
            continue;
        }
        const InsightResult& insight = result.insight();
        
        if (!insight.summary.empty() && result.source != ResultSource::DEGRADED) {
            summaries.push_back(insight.summary);
        }
        
        mergeList(key_points, insight.key_points);
        mergeList(pain_points, insight.pain_points);
        mergeList(feature_requests, insight.feature_requests);
        mergeList(positive_aspects, insight.positive_aspects);
    }
    
    InsightResult combined;
    for (size_t i = 0; i < summaries.size(); ++i) {
        if (i > 0) {
            combined.summary += " ";
        }
        combined.summary += summaries[i];
    }
    if (combined.summary.empty()) {
        combined.summary = "No summary available";
    }
    
    combined.key_points = finalizeList(key_points, limit, "key points");
    combined.pain_points = finalizeList(pain_points, limit, "pain points");
    combined.feature_requests = finalizeList(feature_requests, limit, "feature requests");
    combined.positive_aspects = finalizeList(positive_aspects, limit, "positive aspects");
    
    return combined;
}

void InsightAggregator::mergeList(std::vector<std::string>& target, const std::vector<std::string>& source) {
    for (const auto& item : source) {
        if (item.empty()) {
            continue;
        }
        if (std::find(target.begin(), target.end(), item) == target.end()) {
            target.push_back(item);
        }
    }
}

std::vector<std::string> InsightAggregator::finalizeList(const std::vector<std::string>& items, size_t limit,
                                                         const std::string& category) {
    if (items.empty()) {
        return {"No specific " + category + " identified"};
    }
    
    std::vector<std::string> finalized(items.begin(), items.begin() + std::min(limit, items.size()));
    return finalized;
}

} // namespace Feedlens
