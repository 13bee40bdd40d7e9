#pragma once

#include <string>
#include <vector>

namespace ctxwin {

// Jaccard overlap of lower-cased whitespace tokens, ignoring tokens shorter than
// 3 characters. Two empty token sets compare as 1.0, one empty set as 0.0.
double lexical_similarity(const std::string& a, const std::string& b);

// Coarse topic label from ordered keyword rules (English + German), first match wins:
// identity, spouse, parents, children, friends, work, health, goals, preferences,
// location, otherwise "general".
std::string extract_topic(const std::string& content);

class SimilarityStrategy {
public:
    virtual ~SimilarityStrategy() = default;
    // symmetric, result in [0,1]
    virtual double similarity(const std::string& a, const std::string& b) const = 0;
};

class TopicExtractor {
public:
    virtual ~TopicExtractor() = default;
    virtual std::string topic_of(const std::string& content) const = 0;
};

class LexicalSimilarity final : public SimilarityStrategy {
public:
    double similarity(const std::string& a, const std::string& b) const override {
        return lexical_similarity(a, b);
    }
};

class KeywordTopicExtractor final : public TopicExtractor {
public:
    std::string topic_of(const std::string& content) const override {
        return extract_topic(content);
    }
};

// Mean pairwise (1 - similarity) over all pairs; 1.0 for fewer than two texts.
double diversity_score(const std::vector<std::string>& contents, const SimilarityStrategy& sim);

}  // namespace ctxwin
