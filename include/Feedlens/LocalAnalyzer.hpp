// =================================================================
// include/Feedlens/LocalAnalyzer.hpp
// =================================================================
// Header for the always-available local sentiment analyzer.

#pragma once

#include "Feedlens/AnalysisTypes.hpp"
#include <string>
#include <vector>

namespace Feedlens {

/**
 * @brief Deterministic lexicon and rule based sentiment scoring
 *
 * Produces a compound score in [-1, 1] from word valences, adjusted for
 * negation, intensifiers, contrastive "but" and exclamation marks. The
 * analyzer holds no mutable state, so any number of threads may call it
 * at once.
 */
class LocalAnalyzer {
public:
    LocalAnalyzer() = default;

    /**
     * @brief Analyze one input as a sentiment result tagged LOCAL
     */
    AnalysisResult analyze(const std::string& text) const;

    /**
     * @brief Score one input
     * @return score = (compound + 1) / 2, label from compound thresholds, confidence = |compound|
     */
    SentimentResult analyzeSentiment(const std::string& text) const;

    /**
     * @brief Raw compound score in [-1, 1]
     */
    double compoundScore(const std::string& text) const;

    /**
     * @brief Map a compound score onto a SentimentResult
     */
    static SentimentResult fromCompound(double compound);

    /**
     * @brief Placeholder for insight kinds, which have no local equivalent
     * @param reason Why the remote path was not usable
     * @return Insight with an explanatory summary and empty lists
     */
    static InsightResult degradedInsight(const std::string& reason);

    /// Lexicon valence of a single lowercase word, 0 when unknown
    static double wordValence(const std::string& word);

private:
    static std::vector<std::string> tokenize(const std::string& text);
    static bool isNegation(const std::string& word);
    static double boosterIncrement(const std::string& word);
    static double normalize(double sum);
};

} // namespace Feedlens
