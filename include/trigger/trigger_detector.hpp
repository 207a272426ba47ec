#ifndef TRIGGER_DETECTOR_HPP
#define TRIGGER_DETECTOR_HPP

#include <memory>
#include <string>
#include <vector>

// Decides whether normalized transcript text matches a normalized trigger phrase
class MatchStrategy {
public:
    virtual ~MatchStrategy() = default;
    virtual bool matches(const std::string& normalizedText, const std::string& normalizedPhrase) const = 0;
};

// Plain substring containment
class SubstringMatchStrategy : public MatchStrategy {
public:
    bool matches(const std::string& normalizedText, const std::string& normalizedPhrase) const override;
};

// Containment aligned on word boundaries ("here" does not match inside "where")
class WordSequenceMatchStrategy : public MatchStrategy {
public:
    bool matches(const std::string& normalizedText, const std::string& normalizedPhrase) const override;
};

class TriggerDetector {
public:
    explicit TriggerDetector(std::vector<std::string> phrases,
                             std::unique_ptr<MatchStrategy> strategy = std::make_unique<SubstringMatchStrategy>());

    bool matches(const std::string& text) const;

    const std::vector<std::string>& phrases() const { return phrases_; }

    // Lower-case, punctuation to spaces, single spaces, trimmed
    static std::string normalize(const std::string& text);

    static std::vector<std::string> defaultPhrases();

private:
    std::vector<std::string> phrases_;
    std::unique_ptr<MatchStrategy> strategy_;
};

#endif
