// =================================================================
// src/Feedlens/LocalAnalyzer.cpp
// =================================================================
// Implementation for the always-available local sentiment analyzer.

#include "Feedlens/LocalAnalyzer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace Feedlens {

namespace {

constexpr double kLabelThreshold = 0.05;
constexpr double kNormalizationAlpha = 15.0;
constexpr double kNegationScalar = -0.74;
constexpr double kBoosterIncrement = 0.293;
constexpr double kExclamationIncrement = 0.292;
constexpr double kBeforeButScale = 0.5;
constexpr double kAfterButScale = 1.5;
constexpr size_t kNegationWindow = 3;
constexpr size_t kMaxExclamations = 4;

const std::unordered_map<std::string, double>& lexicon() {
    static const std::unordered_map<std::string, double> words = {
        // Positive
        {"good", 1.9}, {"great", 3.1}, {"excellent", 2.7}, {"amazing", 2.8},
        {"awesome", 3.1}, {"love", 3.2}, {"loved", 2.9}, {"loves", 2.7},
        {"like", 1.5}, {"liked", 1.8}, {"nice", 1.8}, {"best", 3.2},
        {"better", 1.9}, {"perfect", 2.7}, {"fantastic", 2.6}, {"wonderful", 2.7},
        {"happy", 2.7}, {"helpful", 1.8}, {"useful", 1.9}, {"easy", 1.9},
        {"fast", 1.3}, {"smooth", 1.6}, {"reliable", 1.8}, {"intuitive", 1.8},
        {"recommend", 1.5}, {"recommended", 1.6}, {"enjoy", 2.2}, {"enjoyed", 2.3},
        {"fun", 2.3}, {"beautiful", 2.9}, {"clean", 1.7}, {"stable", 1.2},
        {"works", 1.0}, {"worth", 0.9}, {"glad", 2.0}, {"pleased", 1.9},
        {"satisfied", 1.8}, {"impressive", 2.3}, {"impressed", 2.1}, {"solid", 1.4},
        {"thanks", 1.9}, {"thank", 1.5}, {"brilliant", 2.8}, {"superb", 3.1},
        {"ok", 0.5}, {"okay", 0.5}, {"fine", 0.8}, {"decent", 1.2},
        {"improved", 1.6}, {"improvement", 1.4}, {"convenient", 1.6}, {"friendly", 2.2},
        {"responsive", 1.3}, {"win", 2.8}, {"wow", 2.3}, {"yay", 2.4},
        // Negative
        {"bad", -2.5}, {"terrible", -2.5}, {"awful", -2.0}, {"horrible", -2.5},
        {"worst", -3.1}, {"worse", -2.1}, {"hate", -2.7}, {"hated", -3.2},
        {"hates", -1.9}, {"poor", -2.1}, {"slow", -1.3}, {"broken", -2.1},
        {"bug", -1.5}, {"bugs", -1.6}, {"buggy", -1.9}, {"crash", -2.0},
        {"crashes", -2.0}, {"crashed", -2.0}, {"crashing", -2.0}, {"freeze", -1.4},
        {"freezes", -1.5}, {"frozen", -1.3}, {"lag", -1.4}, {"laggy", -1.6},
        {"useless", -1.8}, {"annoying", -1.9}, {"annoyed", -1.6}, {"frustrating", -2.2},
        {"frustrated", -2.0}, {"disappointed", -1.9}, {"disappointing", -2.2}, {"confusing", -1.3},
        {"confused", -1.3}, {"difficult", -1.5}, {"hard", -0.4}, {"fail", -2.0},
        {"fails", -1.8}, {"failed", -2.3}, {"failure", -2.3}, {"error", -1.7},
        {"errors", -1.4}, {"problem", -1.7}, {"problems", -1.7}, {"issue", -1.0},
        {"issues", -1.0}, {"unusable", -2.4}, {"waste", -1.8}, {"expensive", -0.9},
        {"ugly", -2.3}, {"sad", -2.1}, {"angry", -2.3}, {"unhappy", -1.8},
        {"wrong", -2.1}, {"missing", -1.2}, {"lost", -1.3}, {"stuck", -1.2},
        {"meh", -0.5}, {"boring", -1.3}, {"mediocre", -1.0}, {"unreliable", -1.9},
        {"garbage", -2.5}, {"trash", -2.0}, {"scam", -2.9}, {"refund", -0.8},
        {"uninstall", -1.0}, {"uninstalled", -1.2}, {"sucks", -1.5}, {"crap", -1.6}
    };
    return words;
}

const std::unordered_set<std::string>& negations() {
    static const std::unordered_set<std::string> words = {
        "not", "no", "never", "none", "nothing", "nobody", "neither", "nor",
        "cannot", "cant", "can't", "dont", "don't", "doesnt", "doesn't",
        "didnt", "didn't", "isnt", "isn't", "wasnt", "wasn't", "wont", "won't",
        "wouldnt", "wouldn't", "shouldnt", "shouldn't", "arent", "aren't",
        "without", "hardly"
    };
    return words;
}

const std::unordered_map<std::string, double>& boosters() {
    static const std::unordered_map<std::string, double> words = {
        {"very", kBoosterIncrement}, {"really", kBoosterIncrement},
        {"extremely", kBoosterIncrement}, {"so", kBoosterIncrement},
        {"super", kBoosterIncrement}, {"totally", kBoosterIncrement},
        {"absolutely", kBoosterIncrement}, {"incredibly", kBoosterIncrement},
        {"completely", kBoosterIncrement}, {"highly", kBoosterIncrement},
        {"most", kBoosterIncrement}, {"too", kBoosterIncrement},
        {"slightly", -kBoosterIncrement}, {"somewhat", -kBoosterIncrement},
        {"barely", -kBoosterIncrement}, {"kinda", -kBoosterIncrement},
        {"little", -kBoosterIncrement}, {"marginally", -kBoosterIncrement}
    };
    return words;
}

} // anonymous namespace

AnalysisResult LocalAnalyzer::analyze(const std::string& text) const {
    return AnalysisResult::fromSentiment(analyzeSentiment(text), ResultSource::LOCAL);
}

SentimentResult LocalAnalyzer::analyzeSentiment(const std::string& text) const {
    return fromCompound(compoundScore(text));
}

double LocalAnalyzer::compoundScore(const std::string& text) const {
    std::vector<std::string> tokens = tokenize(text);
    if (tokens.empty()) {
        return 0.0;
    }
    
    // Position of the last contrastive "but"
    size_t but_index = tokens.size();
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] == "but") {
            but_index = i;
        }
    }
    
    double sum = 0.0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        double valence = wordValence(tokens[i]);
        if (valence == 0.0) {
            continue;
        }
        
        if (i > 0) {
            double increment = boosterIncrement(tokens[i - 1]);
            if (increment != 0.0) {
                valence += (valence > 0.0) ? increment : -increment;
            }
        }
        
        size_t window_start = (i > kNegationWindow) ? i - kNegationWindow : 0;
        for (size_t j = window_start; j < i; ++j) {
            if (isNegation(tokens[j])) {
                valence *= kNegationScalar;
                break;
            }
        }
        
        if (but_index < tokens.size()) {
            if (i < but_index) {
                valence *= kBeforeButScale;
            } else if (i > but_index) {
                valence *= kAfterButScale;
            }
        }
        
        sum += valence;
    }
    
    if (sum != 0.0) {
        size_t exclamations = static_cast<size_t>(std::count(text.begin(), text.end(), '!'));
        double emphasis = static_cast<double>(std::min(exclamations, kMaxExclamations)) * kExclamationIncrement;
        sum += (sum > 0.0) ? emphasis : -emphasis;
    }
    
    return normalize(sum);
}

SentimentResult LocalAnalyzer::fromCompound(double compound) {
    compound = std::clamp(compound, -1.0, 1.0);
    
    SentimentResult result;
    result.score = (compound + 1.0) / 2.0;
    result.confidence = std::fabs(compound);
    
    if (compound >= kLabelThreshold) {
        result.label = SentimentLabel::POSITIVE;
    } else if (compound <= -kLabelThreshold) {
        result.label = SentimentLabel::NEGATIVE;
    } else {
        result.label = SentimentLabel::NEUTRAL;
    }
    
    return result;
}

InsightResult LocalAnalyzer::degradedInsight(const std::string& reason) {
    InsightResult insight;
    insight.summary = "Insight analysis unavailable: " + (reason.empty() ? std::string("remote service unavailable") : reason) +
                      ". Local processing provides sentiment only.";
    return insight;
}

double LocalAnalyzer::wordValence(const std::string& word) {
    const auto& words = lexicon();
    auto it = words.find(word);
    return it != words.end() ? it->second : 0.0;
}

std::vector<std::string> LocalAnalyzer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '\'') {
            current += static_cast<char>(std::tolower(uc));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    
    return tokens;
}

bool LocalAnalyzer::isNegation(const std::string& word) {
    return negations().count(word) > 0;
}

double LocalAnalyzer::boosterIncrement(const std::string& word) {
    const auto& words = boosters();
    auto it = words.find(word);
    return it != words.end() ? it->second : 0.0;
}

double LocalAnalyzer::normalize(double sum) {
    double compound = sum / std::sqrt(sum * sum + kNormalizationAlpha);
    return std::clamp(compound, -1.0, 1.0);
}

} // namespace Feedlens
