// =================================================================
// include/Feedlens/ResponseParser.hpp
// =================================================================
// Header for parsing semi-structured remote inference responses.

#pragma once

#include "Feedlens/AnalysisTypes.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace Feedlens {

/**
 * @brief Which fallback step produced the parsed payload
 */
enum class ParseStrategy {
    NONE,
    DIRECT,             ///< Whole response parsed as JSON
    FENCED_BLOCK,       ///< First fenced code block
    BRACKET_SCAN,       ///< Substring between first opening and last closing bracket
    QUOTE_NORMALIZED    ///< Candidate with single quotes rewritten to double quotes
};

/**
 * @brief Terminal parse failure; carries the raw text for logging
 */
struct ParseError {
    std::string raw_text;       ///< Response exactly as received
    std::string message;        ///< Last parser error
    size_t attempts = 0;        ///< Number of strategies tried
};

/**
 * @brief Result of ResponseParser::parse
 */
struct ParseResult {
    bool success = false;
    nlohmann::json records;                     ///< Parsed payload when success is true
    ParseStrategy strategy = ParseStrategy::NONE;
    ParseError error;                           ///< Populated when success is false
};

/**
 * @brief Cumulative parser statistics
 */
struct ParseStats {
    size_t total_parses = 0;
    size_t direct = 0;
    size_t fenced = 0;
    size_t bracket = 0;
    size_t quote_normalized = 0;
    size_t failures = 0;
    size_t decode_errors = 0;
};

/**
 * @brief Turns raw, possibly malformed responses into structured records
 *
 * parse() tries an ordered chain of strategies and never throws. The
 * decoders then map the JSON payload onto per-kind result types.
 */
class ResponseParser {
public:
    ResponseParser() = default;

    /**
     * @brief Parse a raw response into a JSON payload
     * @param raw Response text from the remote API
     * @return Parsed records, or a ParseError describing the failure
     */
    ParseResult parse(const std::string& raw);

    /**
     * @brief Decode sentiment records
     * @param records Parsed payload (array of objects, or one object when expected is 1)
     * @param expected Number of inputs in the batch
     * @param out Decoded results in input order
     * @param error Reason when decoding fails
     * @return True if exactly expected records were decoded
     */
    bool decodeSentiments(const nlohmann::json& records, size_t expected,
                          std::vector<SentimentResult>& out, std::string& error);

    /**
     * @brief Decode insight or summary records
     * @param records Parsed payload (array of objects, or one object when expected is 1)
     * @param expected Number of inputs in the batch
     * @param out Decoded results in input order
     * @param error Reason when decoding fails
     * @return True if exactly expected records were decoded
     */
    bool decodeInsights(const nlohmann::json& records, size_t expected,
                        std::vector<InsightResult>& out, std::string& error);

    ParseStats getStats() const;

    static std::string strategyName(ParseStrategy strategy);

    /**
     * @brief Contents of the first fenced code block, without its language tag
     * @return Block contents, or an empty string when no fence is present
     */
    static std::string extractFencedBlock(const std::string& text);

    /**
     * @brief Substring from the first opening bracket to the matching last closing one
     * @return Candidate substring, or an empty string when no brackets are present
     */
    static std::string extractBracketed(const std::string& text);

    static std::string normalizeQuotes(const std::string& text);

private:
    bool tryParse(const std::string& candidate, nlohmann::json& out, std::string& error) const;
    const nlohmann::json* unwrapArray(const nlohmann::json& records, size_t expected,
                                      nlohmann::json& holder, std::string& error) const;
    bool decodeSentimentRecord(const nlohmann::json& record, SentimentResult& out, std::string& error) const;
    InsightResult decodeInsightRecord(const nlohmann::json& record) const;
    static std::vector<std::string> readStringList(const nlohmann::json& record, const std::string& field);
    void recordStrategy(ParseStrategy strategy);
    void addDecodeError(const std::string& error_message);

    ParseStats m_stats;
    mutable std::mutex m_stats_mutex;
};

} // namespace Feedlens
