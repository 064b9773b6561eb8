// =================================================================
// include/Feedlens/PromptBuilder.hpp
// =================================================================
// Header for building per-kind remote inference prompts.

#pragma once

#include "Feedlens/AnalysisTypes.hpp"
#include <string>
#include <vector>

namespace Feedlens {

/**
 * @brief Builds the instruction prompt sent to the remote API for one batch
 *
 * Every prompt lists the batch as "Review i: text" lines and asks for a
 * JSON array holding exactly one object per review, in review order.
 */
class PromptBuilder {
public:
    /**
     * @brief Build the prompt for a batch
     * @param kind Analysis kind
     * @param texts Batch inputs in order
     * @return Prompt text
     */
    static std::string build(AnalysisKind kind, const std::vector<std::string>& texts);

    /// Task instruction for a kind, without the review list
    static std::string instructionFor(AnalysisKind kind);

    /// "Review 1: ..." lines for the batch
    static std::string formatReviews(const std::vector<std::string>& texts);
};

} // namespace Feedlens
