#include "ctxwin/Saturation.hpp"

#include <cmath>
#include <map>
#include <string>
#include <utility>

namespace ctxwin {

static int percent(double x) {
    return static_cast<int>(std::floor(x * 100.0 + 0.5));
}

SaturationResult desaturate(
    const std::vector<EnrichedItem>& admitted,
    const BudgetConfig& cfg,
    const SimilarityStrategy& similarity,
    const TopicExtractor& topics
) {
    const SaturationThresholds& th = cfg.saturation;

    SaturationResult res;
    res.final_items.reserve(admitted.size());

    std::map<std::string, int> topic_counts;

    for (const auto& it : admitted) {
        // 1) redundancy against everything already finalized
        const EnrichedItem* dup = nullptr;
        double dup_sim = 0.0;
        for (const auto& kept : res.final_items) {
            const double s = similarity.similarity(it.candidate.content, kept.candidate.content);
            if (s >= th.redundancy_similarity) {
                dup = &kept;
                dup_sim = s;
                break;
            }
        }

        if (dup) {
            ExclusionReason r;
            r.item_id = it.candidate.id;
            r.domain = it.candidate.domain;
            r.domain_tag = it.candidate.domain_tag;
            r.kind = ExclusionKind::RedundantContent;
            r.explanation = "Content " + std::to_string(percent(dup_sim)) +
                            "% similar to included item '" + dup->candidate.id + "'";
            r.relevance_score = it.relevance_score;
            r.similar_to = dup->candidate.id;
            r.similarity = dup_sim;
            res.excluded.push_back(std::move(r));
            continue;
        }

        // 2) topic saturation; identity facts are never capped
        const bool exempt = has_known_domain(it.candidate) &&
                            cfg.topic_exempt_domains.count(it.candidate.domain) > 0;
        if (!exempt) {
            const std::string topic = topics.topic_of(it.candidate.content);
            const int n = ++topic_counts[topic];

            if (n > th.topic_repetition_limit) {
                ExclusionReason r;
                r.item_id = it.candidate.id;
                r.domain = it.candidate.domain;
                r.domain_tag = it.candidate.domain_tag;
                r.kind = ExclusionKind::TopicSaturation;
                r.explanation = "Topic '" + topic + "' already has " +
                                std::to_string(th.topic_repetition_limit) + " items (diminishing returns)";
                r.relevance_score = it.relevance_score;
                r.topic = topic;
                res.excluded.push_back(std::move(r));
                continue;
            }
        }

        res.final_items.push_back(it);
    }

    std::vector<std::string> contents;
    contents.reserve(res.final_items.size());
    for (const auto& it : res.final_items) contents.push_back(it.candidate.content);

    res.diversity_score = diversity_score(contents, similarity);
    for (auto& it : res.final_items) it.diversity_score = res.diversity_score;

    return res;
}

SaturationResult desaturate(const std::vector<EnrichedItem>& admitted, const BudgetConfig& cfg) {
    const LexicalSimilarity similarity{};
    const KeywordTopicExtractor topics{};
    return desaturate(admitted, cfg, similarity, topics);
}

}  // namespace ctxwin
