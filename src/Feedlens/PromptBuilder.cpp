// =================================================================
// src/Feedlens/PromptBuilder.cpp
// =================================================================
// Implementation for building per-kind remote inference prompts.

#include "Feedlens/PromptBuilder.hpp"
#include <sstream>

namespace Feedlens {

std::string PromptBuilder::build(AnalysisKind kind, const std::vector<std::string>& texts) {
    std::stringstream prompt;
    prompt << instructionFor(kind) << "\n\n";
    prompt << "There are " << texts.size() << " reviews. Return a JSON array with exactly "
           << texts.size() << " objects, one per review, in the same order.\n\n";
    prompt << formatReviews(texts) << "\n";
    prompt << "Return ONLY the JSON array, with no explanation or markdown.";
    return prompt.str();
}

std::string PromptBuilder::instructionFor(AnalysisKind kind) {
    switch (kind) {
        case AnalysisKind::SENTIMENT:
            return "Analyze the sentiment of each customer review below. For each review, return an object "
                   "with \"score\" (number from 0.0 = very negative to 1.0 = very positive), "
                   "\"label\" (\"POSITIVE\", \"NEGATIVE\" or \"NEUTRAL\") and \"confidence\" "
                   "(number from 0.0 to 1.0).";
        case AnalysisKind::INSIGHT:
            return "Extract actionable product insights from each customer review below. For each review, "
                   "return an object with \"summary\" (one sentence), \"key_points\", \"pain_points\", "
                   "\"feature_requests\" and \"positive_aspects\" (each an array of short strings, "
                   "empty when nothing applies).";
        case AnalysisKind::SUMMARY:
            return "Summarize each customer review below. For each review, return an object with "
                   "\"summary\" (at most two sentences), \"key_points\", \"pain_points\", "
                   "\"feature_requests\" and \"positive_aspects\" (each an array of short strings, "
                   "empty when nothing applies).";
    }
    return "";
}

std::string PromptBuilder::formatReviews(const std::vector<std::string>& texts) {
    std::stringstream reviews;
    for (size_t i = 0; i < texts.size(); ++i) {
        reviews << "Review " << (i + 1) << ": " << texts[i] << "\n";
    }
    return reviews.str();
}

} // namespace Feedlens
