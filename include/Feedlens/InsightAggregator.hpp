// =================================================================
// include/Feedlens/InsightAggregator.hpp
// =================================================================
// Header for merging per-input insights into one collection-level record.

#pragma once

#include "Feedlens/AnalysisTypes.hpp"
#include <string>
#include <vector>

namespace Feedlens {

/**
 * @brief Combines insight or summary results for a whole input collection
 */
class InsightAggregator {
public:
    static constexpr size_t DEFAULT_LIMIT = 10;

    /**
     * @brief Merge insight results
     *
     * Summaries are joined with spaces. Each list is deduplicated in
     * first-seen order and truncated to limit; an empty list receives a
     * "No specific <category> identified" placeholder. Sentiment results
     * are skipped.
     *
     * @param results Per-input results
     * @param limit Maximum entries per list
     * @return Combined insight
     */
    static InsightResult combine(const std::vector<AnalysisResult>& results, size_t limit = DEFAULT_LIMIT);

private:
    static void mergeList(std::vector<std::string>& target, const std::vector<std::string>& source);
    static std::vector<std::string> finalizeList(const std::vector<std::string>& items, size_t limit,
                                                 const std::string& category);
};

} // namespace Feedlens
