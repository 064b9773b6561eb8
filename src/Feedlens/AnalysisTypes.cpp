// =================================================================
// src/Feedlens/AnalysisTypes.cpp
// =================================================================

#include "Feedlens/AnalysisTypes.hpp"
#include <algorithm>
#include <cctype>

namespace Feedlens {

static std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool SentimentResult::operator==(const SentimentResult& other) const {
    return score == other.score && label == other.label && confidence == other.confidence;
}

bool InsightResult::operator==(const InsightResult& other) const {
    return summary == other.summary &&
           key_points == other.key_points &&
           pain_points == other.pain_points &&
           feature_requests == other.feature_requests &&
           positive_aspects == other.positive_aspects;
}

AnalysisResult AnalysisResult::fromSentiment(const SentimentResult& sentiment, ResultSource source) {
    AnalysisResult result;
    result.kind = AnalysisKind::SENTIMENT;
    result.payload = sentiment;
    result.source = source;
    return result;
}

AnalysisResult AnalysisResult::fromInsight(AnalysisKind kind, const InsightResult& insight, ResultSource source) {
    AnalysisResult result;
    result.kind = kind;
    result.payload = insight;
    result.source = source;
    return result;
}

bool AnalysisResult::operator==(const AnalysisResult& other) const {
    return kind == other.kind && source == other.source && payload == other.payload;
}

std::string kindToString(AnalysisKind kind) {
    switch (kind) {
        case AnalysisKind::SENTIMENT: return "sentiment";
        case AnalysisKind::INSIGHT: return "insight";
        case AnalysisKind::SUMMARY: return "summary";
        default: return "unknown";
    }
}

std::optional<AnalysisKind> parseKind(const std::string& name) {
    std::string upper = toUpper(name);
    if (upper == "SENTIMENT") return AnalysisKind::SENTIMENT;
    if (upper == "INSIGHT" || upper == "INSIGHTS") return AnalysisKind::INSIGHT;
    if (upper == "SUMMARY") return AnalysisKind::SUMMARY;
    return std::nullopt;
}

std::string labelToString(SentimentLabel label) {
    switch (label) {
        case SentimentLabel::POSITIVE: return "POSITIVE";
        case SentimentLabel::NEGATIVE: return "NEGATIVE";
        case SentimentLabel::NEUTRAL: return "NEUTRAL";
        default: return "NEUTRAL";
    }
}

std::optional<SentimentLabel> parseLabel(const std::string& name) {
    std::string upper = toUpper(name);
    if (upper == "POSITIVE") return SentimentLabel::POSITIVE;
    if (upper == "NEGATIVE") return SentimentLabel::NEGATIVE;
    if (upper == "NEUTRAL") return SentimentLabel::NEUTRAL;
    return std::nullopt;
}

std::string sourceToString(ResultSource source) {
    switch (source) {
        case ResultSource::REMOTE: return "remote";
        case ResultSource::LOCAL: return "local";
        case ResultSource::DEGRADED: return "degraded";
        default: return "unknown";
    }
}

void to_json(nlohmann::json& j, const SentimentResult& result) {
    j = nlohmann::json{
        {"score", result.score},
        {"label", labelToString(result.label)},
        {"confidence", result.confidence}
    };
}

void to_json(nlohmann::json& j, const InsightResult& result) {
    j = nlohmann::json{
        {"summary", result.summary},
        {"key_points", result.key_points},
        {"pain_points", result.pain_points},
        {"feature_requests", result.feature_requests},
        {"positive_aspects", result.positive_aspects}
    };
}

void to_json(nlohmann::json& j, const AnalysisResult& result) {
    if (result.isSentiment()) {
        to_json(j, result.sentiment());
    } else {
        to_json(j, result.insight());
    }
    j["kind"] = kindToString(result.kind);
    j["source"] = sourceToString(result.source);
}

} // namespace Feedlens
