// =================================================================
// src/Feedlens/ResponseParser.cpp
// =================================================================
// Implementation for parsing semi-structured remote inference responses.

#include "Feedlens/ResponseParser.hpp"
#include "Feedlens/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Feedlens {

ParseResult ResponseParser::parse(const std::string& raw) {
    ParseResult result;
    result.error.raw_text = raw;
    
    std::string last_error = "empty response";
    size_t attempts = 0;
    
    auto attempt = [&](const std::string& candidate, ParseStrategy strategy) {
        if (candidate.empty()) {
            return false;
        }
        attempts++;
        nlohmann::json parsed;
        if (!tryParse(candidate, parsed, last_error)) {
            return false;
        }
        result.success = true;
        result.records = std::move(parsed);
        result.strategy = strategy;
        return true;
    };
    
    // 1. Whole response
    if (attempt(raw, ParseStrategy::DIRECT)) {
        recordStrategy(result.strategy);
        return result;
    }
    
    // 2. First fenced block
    std::string fenced = extractFencedBlock(raw);
    if (attempt(fenced, ParseStrategy::FENCED_BLOCK)) {
        recordStrategy(result.strategy);
        return result;
    }
    
    // 3. Bracket detection over the raw text
    std::string bracketed = extractBracketed(raw);
    if (attempt(bracketed, ParseStrategy::BRACKET_SCAN)) {
        recordStrategy(result.strategy);
        return result;
    }
    
    // 4. Single quotes rewritten within the best candidate
    std::string base = fenced.empty() ? raw : fenced;
    std::string candidate = extractBracketed(base);
    if (candidate.empty()) {
        candidate = base;
    }
    if (candidate.find('\'') != std::string::npos &&
        attempt(normalizeQuotes(candidate), ParseStrategy::QUOTE_NORMALIZED)) {
        recordStrategy(result.strategy);
        return result;
    }
    
    result.error.message = last_error;
    result.error.attempts = attempts;
    recordStrategy(ParseStrategy::NONE);
    
    LOG_WARNING("ResponseParser", "Unparseable response after " + std::to_string(attempts) +
                " attempts: " + last_error);
    LOG_DEBUG("ResponseParser", "Raw response: " + raw.substr(0, 500));
    
    return result;
}

bool ResponseParser::decodeSentiments(const nlohmann::json& records, size_t expected,
                                      std::vector<SentimentResult>& out, std::string& error) {
    out.clear();
    nlohmann::json holder;
    const nlohmann::json* items = unwrapArray(records, expected, holder, error);
    if (!items) {
        addDecodeError(error);
        return false;
    }
    
    out.reserve(items->size());
    for (size_t i = 0; i < items->size(); ++i) {
        SentimentResult sentiment;
        std::string item_error;
        if (!decodeSentimentRecord((*items)[i], sentiment, item_error)) {
            error = "Record " + std::to_string(i) + ": " + item_error;
            out.clear();
            addDecodeError(error);
            return false;
        }
        out.push_back(sentiment);
    }
    
    return true;
}

bool ResponseParser::decodeInsights(const nlohmann::json& records, size_t expected,
                                    std::vector<InsightResult>& out, std::string& error) {
    out.clear();
    nlohmann::json holder;
    const nlohmann::json* items = unwrapArray(records, expected, holder, error);
    if (!items) {
        addDecodeError(error);
        return false;
    }
    
    out.reserve(items->size());
    for (size_t i = 0; i < items->size(); ++i) {
        if (!(*items)[i].is_object()) {
            error = "Record " + std::to_string(i) + " is not an object";
            out.clear();
            addDecodeError(error);
            return false;
        }
        out.push_back(decodeInsightRecord((*items)[i]));
    }
    
    return true;
}

ParseStats ResponseParser::getStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

std::string ResponseParser::strategyName(ParseStrategy strategy) {
    switch (strategy) {
        case ParseStrategy::DIRECT: return "direct";
        case ParseStrategy::FENCED_BLOCK: return "fenced_block";
        case ParseStrategy::BRACKET_SCAN: return "bracket_scan";
        case ParseStrategy::QUOTE_NORMALIZED: return "quote_normalized";
        case ParseStrategy::NONE:
        default: return "none";
    }
}

std::string ResponseParser::extractFencedBlock(const std::string& text) {
    const std::string fence = "```";
    size_t open = text.find(fence);
    if (open == std::string::npos) {
        return "";
    }
    
    size_t content_start = open + fence.size();
    
    // Skip a format-name token such as "json" directly after the fence
    size_t token_end = content_start;
    while (token_end < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[token_end])) || text[token_end] == '_' ||
            text[token_end] == '-' || text[token_end] == '+')) {
        token_end++;
    }
    if (token_end > content_start &&
        (token_end == text.size() || std::isspace(static_cast<unsigned char>(text[token_end])))) {
        content_start = token_end;
    }
    
    size_t close = text.find(fence, content_start);
    std::string content = (close == std::string::npos)
        ? text.substr(content_start)
        : text.substr(content_start, close - content_start);
    
    content.erase(0, std::min(content.size(), content.find_first_not_of(" \t\r\n")));
    size_t last = content.find_last_not_of(" \t\r\n");
    content.erase(last == std::string::npos ? 0 : last + 1);
    return content;
}

std::string ResponseParser::extractBracketed(const std::string& text) {
    size_t open = text.find_first_of("[{");
    if (open == std::string::npos) {
        return "";
    }
    
    char closing = (text[open] == '[') ? ']' : '}';
    size_t close = text.rfind(closing);
    if (close == std::string::npos || close <= open) {
        return "";
    }
    
    return text.substr(open, close - open + 1);
}

std::string ResponseParser::normalizeQuotes(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), '\'', '"');
    return normalized;
}

bool ResponseParser::tryParse(const std::string& candidate, nlohmann::json& out, std::string& error) const {
    try {
        out = nlohmann::json::parse(candidate);
    } catch (const nlohmann::json::exception& e) {
        // parse_error for bad syntax, out_of_range for numbers that overflow a double
        error = e.what();
        return false;
    }
    
    // Bare scalars are never a usable payload
    if (!out.is_object() && !out.is_array()) {
        error = "payload is not an object or array";
        return false;
    }
    return true;
}

const nlohmann::json* ResponseParser::unwrapArray(const nlohmann::json& records, size_t expected,
                                                  nlohmann::json& holder, std::string& error) const {
    const nlohmann::json* items = &records;
    
    if (records.is_object()) {
        // Some responses wrap the array: {"results": [...]}
        for (const char* key : {"results", "reviews", "items", "data"}) {
            auto it = records.find(key);
            if (it != records.end() && it->is_array()) {
                items = &(*it);
                break;
            }
        }
        
        if (items == &records) {
            if (expected != 1) {
                error = "Expected " + std::to_string(expected) + " records but got a single object";
                return nullptr;
            }
            holder = nlohmann::json::array({records});
            items = &holder;
        }
    }
    
    if (!items->is_array()) {
        error = "Payload is not an array";
        return nullptr;
    }
    
    if (items->size() != expected) {
        error = "Expected " + std::to_string(expected) + " records but got " +
                std::to_string(items->size());
        return nullptr;
    }
    
    return items;
}

bool ResponseParser::decodeSentimentRecord(const nlohmann::json& record, SentimentResult& out,
                                           std::string& error) const {
    if (!record.is_object()) {
        error = "not an object";
        return false;
    }
    
    bool has_score = record.contains("score") && record["score"].is_number();
    bool has_label = record.contains("label") && record["label"].is_string();
    
    if (!has_score && !has_label) {
        error = "neither score nor label present";
        return false;
    }
    
    std::optional<SentimentLabel> label;
    if (has_label) {
        label = parseLabel(record["label"].get<std::string>());
        if (!label) {
            error = "unknown label '" + record["label"].get<std::string>() + "'";
            return false;
        }
    }
    
    if (has_score) {
        out.score = std::clamp(record["score"].get<double>(), 0.0, 1.0);
    } else {
        out.score = (*label == SentimentLabel::POSITIVE) ? 0.75
                  : (*label == SentimentLabel::NEGATIVE) ? 0.25 : 0.5;
    }
    
    if (label) {
        out.label = *label;
    } else {
        // Same thresholds as the local analyzer, expressed on the [0, 1] scale
        double compound = out.score * 2.0 - 1.0;
        out.label = compound >= 0.05 ? SentimentLabel::POSITIVE
                  : compound <= -0.05 ? SentimentLabel::NEGATIVE : SentimentLabel::NEUTRAL;
    }
    
    if (record.contains("confidence") && record["confidence"].is_number()) {
        out.confidence = std::clamp(record["confidence"].get<double>(), 0.0, 1.0);
    } else {
        out.confidence = std::fabs(out.score * 2.0 - 1.0);
    }
    
    return true;
}

InsightResult ResponseParser::decodeInsightRecord(const nlohmann::json& record) const {
    InsightResult insight;
    
    if (record.contains("summary") && record["summary"].is_string()) {
        insight.summary = record["summary"].get<std::string>();
    }
    if (insight.summary.empty()) {
        insight.summary = "No summary available";
    }
    
    insight.key_points = readStringList(record, "key_points");
    insight.pain_points = readStringList(record, "pain_points");
    insight.feature_requests = readStringList(record, "feature_requests");
    insight.positive_aspects = readStringList(record, "positive_aspects");
    
    return insight;
}

std::vector<std::string> ResponseParser::readStringList(const nlohmann::json& record, const std::string& field) {
    std::vector<std::string> values;
    
    auto it = record.find(field);
    if (it == record.end() || !it->is_array()) {
        return values;
    }
    
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        } else if (!item.is_null()) {
            values.push_back(item.dump());
        }
    }
    return values;
}

void ResponseParser::recordStrategy(ParseStrategy strategy) {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_stats.total_parses++;
    switch (strategy) {
        case ParseStrategy::DIRECT: m_stats.direct++; break;
        case ParseStrategy::FENCED_BLOCK: m_stats.fenced++; break;
        case ParseStrategy::BRACKET_SCAN: m_stats.bracket++; break;
        case ParseStrategy::QUOTE_NORMALIZED: m_stats.quote_normalized++; break;
        case ParseStrategy::NONE: m_stats.failures++; break;
    }
}

void ResponseParser::addDecodeError(const std::string& error_message) {
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.decode_errors++;
    }
    LOG_WARNING("ResponseParser", "Decode failed: " + error_message);
}

} // namespace Feedlens
