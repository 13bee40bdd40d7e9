#include "ctxwin/Scorer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "ctxwin/Classifier.hpp"
#include "text/TextUtil.hpp"

namespace ctxwin {

static int clamp_score(int x) {
    return std::max(0, std::min(100, x));
}

static int round_half_up(double x) {
    return static_cast<int>(std::floor(x + 0.5));
}

double decay_factor(double age_hours, const DecayConfig& cfg) {
    const double age = std::max(0.0, age_hours);

    double f = 1.0;
    switch (cfg.curve) {
        case DecayCurve::Exponential:
            f = std::pow(0.5, age / cfg.half_life_hours);
            break;
        case DecayCurve::Linear:
            f = 1.0 - age / cfg.window_hours;
            break;
    }
    return std::max(cfg.floor, f);
}

double domain_boost(Domain d) {
    switch (d) {
        case Domain::Personal: return 1.5;
        case Domain::Relationships: return 1.3;
        case Domain::Health: return 1.2;
        default: return 1.0;
    }
}

int relevance_score(const Candidate& c, const DecayConfig& decay, TimePoint now) {
    const double base = static_cast<double>(clamp_score(c.importance));
    const double decayed = base * decay_factor(age_hours(c, now), decay);
    const double boost = has_known_domain(c) ? domain_boost(c.domain) : 1.0;
    return clamp_score(round_half_up(decayed * boost));
}

int confidence_score(const Candidate& c, int quality_score) {
    int confidence = quality_score;

    switch (parse_provenance(c.source)) {
        case Provenance::System: confidence += 10; break;
        case Provenance::TypedText: confidence += 5; break;
        case Provenance::VoiceTranscript: confidence -= 5; break;
        case Provenance::Other: break;
    }

    // high-importance items were explicitly marked upstream
    if (c.importance >= 70) confidence += 10;
    else if (c.importance >= 50) confidence += 5;

    return clamp_score(confidence);
}

std::vector<EnrichedItem> enrich_candidates(
    const std::vector<Candidate>& candidates,
    int quality_score,
    const BudgetConfig& cfg,
    TimePoint now
) {
    std::vector<EnrichedItem> out;
    out.reserve(candidates.size());

    for (const auto& c : candidates) {
        const Classification cls = classify(c, now);

        EnrichedItem it;
        it.candidate = c;
        it.relevance_score = relevance_score(c, cfg.decay, now);
        it.confidence_score = confidence_score(c, quality_score);
        it.priority_tier = cls.tier;
        it.memory_type = cls.memory_type;
        it.char_count = static_cast<int>(textutil::utf8_length(c.content));
        it.diversity_score = 1.0;

        out.push_back(std::move(it));
    }

    return out;
}

}  // namespace ctxwin
