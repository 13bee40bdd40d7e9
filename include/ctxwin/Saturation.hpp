#pragma once

#include <vector>

#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"
#include "ctxwin/Similarity.hpp"

namespace ctxwin {

struct SaturationResult {
    std::vector<EnrichedItem> final_items;       // survivors, admission order kept
    std::vector<ExclusionReason> excluded;       // redundant_content / topic_saturation
    double diversity_score = 1.0;
};

// Second pass over admitted items, in the order given (no re-sorting):
// drops near-duplicates of already finalized items, then caps per-topic repetition
// outside the topic-exempt domains. Sets diversity_score on every survivor.
SaturationResult desaturate(
    const std::vector<EnrichedItem>& admitted,
    const BudgetConfig& cfg,
    const SimilarityStrategy& similarity,
    const TopicExtractor& topics
);

// Same, using the lexical similarity and keyword topic rules.
SaturationResult desaturate(const std::vector<EnrichedItem>& admitted, const BudgetConfig& cfg);

}  // namespace ctxwin
