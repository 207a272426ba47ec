#include "trigger/trigger_detector.hpp"

#include <cctype>
#include <utility>

bool SubstringMatchStrategy::matches(const std::string& normalizedText, const std::string& normalizedPhrase) const {
    return normalizedText.find(normalizedPhrase) != std::string::npos;
}

bool WordSequenceMatchStrategy::matches(const std::string& normalizedText, const std::string& normalizedPhrase) const {
    // normalize() leaves single spaces between words, so padding gives word boundaries
    const std::string text = " " + normalizedText + " ";
    const std::string phrase = " " + normalizedPhrase + " ";
    return text.find(phrase) != std::string::npos;
}

// Constructor, empty phrases are discarded
TriggerDetector::TriggerDetector(std::vector<std::string> phrases, std::unique_ptr<MatchStrategy> strategy)
    : strategy_(std::move(strategy)) {
    if (!strategy_) strategy_ = std::make_unique<SubstringMatchStrategy>();

    for (const auto& p : phrases) {
        std::string normalized = normalize(p);
        if (!normalized.empty()) phrases_.push_back(std::move(normalized));
    }
}

bool TriggerDetector::matches(const std::string& text) const {
    const std::string normalized = normalize(text);
    if (normalized.empty()) return false;

    for (const auto& phrase : phrases_) {
        if (strategy_->matches(normalized, phrase)) return true;
    }
    return false;
}

std::string TriggerDetector::normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool prevSpace = false;
    for (unsigned char ch : text) {
        // apostrophes stay inside words ("what's")
        if (std::isalnum(ch) || ch == '\'' || ch >= 0x80) {
            out.push_back((char)std::tolower(ch));
            prevSpace = false;
        } else if (!out.empty() && !prevSpace) {
            out.push_back(' ');
            prevSpace = true;
        }
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> TriggerDetector::defaultPhrases() {
    return {"what is written here", "what is written there"};
}
