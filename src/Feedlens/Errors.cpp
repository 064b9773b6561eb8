// =================================================================
// src/Feedlens/Errors.cpp
// =================================================================

#include "Feedlens/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace Feedlens {

// "rate" only counts as a standalone word so "generate" or "accurate" do not match
static bool containsWord(const std::string& text, const std::string& word) {
    size_t pos = text.find(word);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !std::isalpha(static_cast<unsigned char>(text[pos - 1]));
        size_t end = pos + word.size();
        bool right_ok = end >= text.size() || !std::isalpha(static_cast<unsigned char>(text[end]));
        if (left_ok && right_ok) {
            return true;
        }
        pos = text.find(word, pos + 1);
    }
    return false;
}

bool isQuotaFailure(int status, const std::string& message) {
    if (status == 429) {
        return true;
    }
    
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    return lower.find("429") != std::string::npos ||
           lower.find("quota") != std::string::npos ||
           containsWord(lower, "rate");
}

std::unique_ptr<RemoteCallError> classifyRemoteFailure(int status, const std::string& message) {
    if (isQuotaFailure(status, message)) {
        return std::make_unique<QuotaExceededError>(message, status == 0 ? 429 : status);
    }
    return std::make_unique<RemoteCallError>(message, status);
}

void throwRemoteFailure(int status, const std::string& message) {
    auto error = classifyRemoteFailure(status, message);
    if (error->isQuotaExceeded()) {
        throw QuotaExceededError(error->what(), error->getStatus());
    }
    throw *error;
}

} // namespace Feedlens
