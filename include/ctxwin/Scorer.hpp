#pragma once

#include <vector>

#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"

namespace ctxwin {

// Multiplier in [floor, 1] for an item of the given age. Future items (negative age)
// are treated as brand new.
double decay_factor(double age_hours, const DecayConfig& cfg);

// personal 1.5, relationships 1.3, health 1.2, everything else 1.0
double domain_boost(Domain d);

// importance * decay * domain boost, rounded half-up and clamped to 0..100
int relevance_score(const Candidate& c, const DecayConfig& decay, TimePoint now);

// quality score adjusted by provenance (system +10, typed +5, voice -5) and
// importance (>=70 +10, >=50 +5), clamped to 0..100
int confidence_score(const Candidate& c, int quality_score);

// Scores and classifies every candidate; output order equals input order.
std::vector<EnrichedItem> enrich_candidates(
    const std::vector<Candidate>& candidates,
    int quality_score,
    const BudgetConfig& cfg,
    TimePoint now
);

}  // namespace ctxwin
