// =================================================================
// include/Feedlens/AnalysisTypes.hpp
// =================================================================
// Request, result and progress types shared by every analysis component.

#pragma once

#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <variant>
#include <functional>
#include <optional>

namespace Feedlens {

/**
 * @brief Kind of analysis requested; each kind has its own cache partition
 */
enum class AnalysisKind {
    SENTIMENT,  ///< Per-input polarity score
    INSIGHT,    ///< Per-input key points, pain points, requests, positives
    SUMMARY     ///< Per-input condensed summary with the same list fields
};

/**
 * @brief Sentiment polarity label
 */
enum class SentimentLabel {
    POSITIVE,
    NEGATIVE,
    NEUTRAL
};

/**
 * @brief How a result was produced
 */
enum class ResultSource {
    REMOTE,     ///< Parsed from a remote inference response
    LOCAL,      ///< Computed by the local analyzer
    DEGRADED    ///< Placeholder produced because no analysis path was usable
};

/**
 * @brief Sentiment of a single input
 */
struct SentimentResult {
    double score = 0.5;                           ///< Positivity in [0, 1]
    SentimentLabel label = SentimentLabel::NEUTRAL;
    double confidence = 0.0;                      ///< Confidence in [0, 1]

    bool operator==(const SentimentResult& other) const;
    bool operator!=(const SentimentResult& other) const { return !(*this == other); }
};

/**
 * @brief Insight or summary extracted from a single input
 */
struct InsightResult {
    std::string summary;
    std::vector<std::string> key_points;
    std::vector<std::string> pain_points;
    std::vector<std::string> feature_requests;
    std::vector<std::string> positive_aspects;

    bool operator==(const InsightResult& other) const;
    bool operator!=(const InsightResult& other) const { return !(*this == other); }
};

/**
 * @brief Result for one input of an AnalysisRequest
 *
 * The payload holds a SentimentResult for SENTIMENT requests and an
 * InsightResult for INSIGHT and SUMMARY requests.
 */
struct AnalysisResult {
    AnalysisKind kind = AnalysisKind::SENTIMENT;
    std::variant<SentimentResult, InsightResult> payload;
    ResultSource source = ResultSource::LOCAL;

    bool isSentiment() const { return std::holds_alternative<SentimentResult>(payload); }
    const SentimentResult& sentiment() const { return std::get<SentimentResult>(payload); }
    const InsightResult& insight() const { return std::get<InsightResult>(payload); }

    static AnalysisResult fromSentiment(const SentimentResult& sentiment, ResultSource source);
    static AnalysisResult fromInsight(AnalysisKind kind, const InsightResult& insight, ResultSource source);

    bool operator==(const AnalysisResult& other) const;
    bool operator!=(const AnalysisResult& other) const { return !(*this == other); }
};

/**
 * @brief Progress notification pushed after each completed batch
 */
struct ProgressEvent {
    size_t batches_done = 0;
    size_t batches_total = 0;
    size_t items_processed = 0;
    size_t items_total = 0;
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

/**
 * @brief Ordered inputs plus the analysis to run on them
 */
struct AnalysisRequest {
    std::vector<std::string> texts;               ///< Inputs, analyzed in order
    AnalysisKind kind = AnalysisKind::SENTIMENT;
    ProgressSink progress;                        ///< Optional progress callback
};

// Conversions
std::string kindToString(AnalysisKind kind);
std::optional<AnalysisKind> parseKind(const std::string& name);
std::string labelToString(SentimentLabel label);
std::optional<SentimentLabel> parseLabel(const std::string& name);
std::string sourceToString(ResultSource source);

void to_json(nlohmann::json& j, const SentimentResult& result);
void to_json(nlohmann::json& j, const InsightResult& result);
void to_json(nlohmann::json& j, const AnalysisResult& result);

} // namespace Feedlens
