#include "ctxwin/Similarity.hpp"

#include <set>
#include <utility>

#include "text/TextUtil.hpp"

namespace ctxwin {

static std::set<std::string> similarity_tokens(const std::string& s) {
    std::set<std::string> out;
    for (const auto& t : textutil::split_whitespace(textutil::to_lower_utf8(s))) {
        if (textutil::utf8_length(t) > 2) out.insert(t);
    }
    return out;
}

double lexical_similarity(const std::string& a, const std::string& b) {
    const auto wa = similarity_tokens(a);
    const auto wb = similarity_tokens(b);

    if (wa.empty() && wb.empty()) return 1.0;
    if (wa.empty() || wb.empty()) return 0.0;

    size_t inter = 0;
    for (const auto& w : wa) {
        if (wb.count(w)) ++inter;
    }

    const size_t uni = wa.size() + wb.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

namespace {

struct TopicRule {
    const char* topic;
    std::vector<std::string> words;
    std::vector<std::pair<std::string, std::string>> phrases;
};

// ordered by specificity
const std::vector<TopicRule>& topic_rules() {
    static const std::vector<TopicRule> rules = {
        {"identity",    {"name", "heiße", "heiß", "heisse", "heiss", "bin", "called"}, {}},
        {"spouse",      {"wife", "husband", "partner", "spouse", "fiancé", "fiancée",
                         "girlfriend", "boyfriend"}, {}},
        {"parents",     {"mother", "father", "mom", "dad", "parent", "mutter", "vater"}, {}},
        {"children",    {"child", "son", "daughter", "kid", "kinder"}, {}},
        {"friends",     {"friend", "freund"}, {}},
        {"work",        {"work", "job", "career", "arbeit", "beruf"}, {}},
        {"health",      {"health", "sick", "pain", "doctor", "arzt", "gesund"}, {}},
        {"goals",       {"goal", "plan", "möchte", "ziel"}, {{"want", "to"}}},
        {"preferences", {"like", "love", "prefer", "favorite", "mag", "liebe"}, {}},
        {"location",    {"live", "home", "wohne", "hometown"}, {}},
    };
    return rules;
}

bool rule_matches(const TopicRule& rule,
                  const std::set<std::string>& words,
                  const std::vector<std::string>& tokens) {
    for (const auto& w : rule.words) {
        if (words.count(w)) return true;
    }
    for (const auto& p : rule.phrases) {
        for (size_t i = 0; i + 1 < tokens.size(); ++i) {
            if (tokens[i] == p.first && tokens[i + 1] == p.second) return true;
        }
    }
    return false;
}

}  // namespace

std::string extract_topic(const std::string& content) {
    const std::vector<std::string> tokens = textutil::word_tokens(content);
    const std::set<std::string> words(tokens.begin(), tokens.end());

    for (const auto& rule : topic_rules()) {
        if (rule_matches(rule, words, tokens)) return rule.topic;
    }
    return "general";
}

double diversity_score(const std::vector<std::string>& contents, const SimilarityStrategy& sim) {
    if (contents.size() <= 1) return 1.0;

    double total = 0.0;
    size_t comparisons = 0;

    for (size_t i = 0; i < contents.size(); ++i) {
        for (size_t j = i + 1; j < contents.size(); ++j) {
            total += 1.0 - sim.similarity(contents[i], contents[j]);
            ++comparisons;
        }
    }

    return comparisons > 0 ? total / static_cast<double>(comparisons) : 1.0;
}

}  // namespace ctxwin
