#include "ctxwin/Selector.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace ctxwin {

static int tier_rank(PriorityTier t) {
    switch (t) {
        case PriorityTier::Critical: return 0;
        case PriorityTier::Relevant: return 1;
        case PriorityTier::Optional: return 2;
    }
    return 3;
}

std::vector<EnrichedItem> sort_for_admission(std::vector<EnrichedItem> items) {
    std::stable_sort(items.begin(), items.end(),
                     [](const EnrichedItem& a, const EnrichedItem& b) {
                         const int ta = tier_rank(a.priority_tier);
                         const int tb = tier_rank(b.priority_tier);
                         if (ta != tb) return ta < tb;
                         return a.relevance_score > b.relevance_score;
                     });
    return items;
}

namespace {

struct Usage {
    int items = 0;
    int chars = 0;
};

ExclusionReason make_reason(const EnrichedItem& it, ExclusionKind kind, LimitScope scope, std::string explanation) {
    ExclusionReason r;
    r.item_id = it.candidate.id;
    r.domain = it.candidate.domain;
    r.domain_tag = it.candidate.domain_tag;
    r.kind = kind;
    r.scope = scope;
    r.explanation = std::move(explanation);
    r.relevance_score = it.relevance_score;
    return r;
}

}  // namespace

SelectorResult select_items(const std::vector<EnrichedItem>& items, const BudgetConfig& cfg) {
    SelectorResult res;
    res.included.reserve(items.size());

    // unknown tags get their own counters but borrow their fallback domain's limits
    std::map<std::string, Usage> domain_usage;
    Usage total;

    auto check = [&](const EnrichedItem& it) -> std::optional<ExclusionReason> {
        const Domain d = it.candidate.domain;
        const std::string dname = domain_label(it.candidate);
        const DomainBudget& budget = budget_for(cfg, d);
        const Usage& du = domain_usage[dname];

        if (it.relevance_score < budget.min_relevance) {
            return make_reason(it, ExclusionKind::BelowRelevanceThreshold, LimitScope::Domain,
                               "Relevance " + std::to_string(it.relevance_score) +
                               " < threshold " + std::to_string(budget.min_relevance));
        }

        if (it.confidence_score < budget.min_confidence) {
            ExclusionReason r = make_reason(it, ExclusionKind::BelowConfidenceThreshold, LimitScope::Domain,
                                            "Confidence " + std::to_string(it.confidence_score) +
                                            " < threshold " + std::to_string(budget.min_confidence));
            r.relevance_score.reset();
            r.confidence_score = it.confidence_score;
            return r;
        }

        if (du.items >= budget.max_items) {
            return make_reason(it, ExclusionKind::DomainCapExceeded, LimitScope::Domain,
                               "Domain '" + dname + "' item cap (" + std::to_string(budget.max_items) + ") reached");
        }

        if (du.chars + it.char_count > budget.max_chars) {
            return make_reason(it, ExclusionKind::CharLimitExceeded, LimitScope::Domain,
                               "Domain '" + dname + "' char limit (" + std::to_string(budget.max_chars) +
                               ") would be exceeded");
        }

        if (total.items >= cfg.total_item_limit) {
            return make_reason(it, ExclusionKind::TotalCapExceeded, LimitScope::Global,
                               "Total item limit (" + std::to_string(cfg.total_item_limit) + ") reached");
        }

        if (total.chars + it.char_count > cfg.total_budget_chars) {
            return make_reason(it, ExclusionKind::CharLimitExceeded, LimitScope::Global,
                               "Total char limit (" + std::to_string(cfg.total_budget_chars) +
                               ") would be exceeded");
        }

        // keep sensitive domains from flooding the context; critical items still pass
        if (has_known_domain(it.candidate) &&
            cfg.sensitive_domains.count(d) &&
            du.items >= cfg.sensitive_domain_item_limit &&
            it.priority_tier != PriorityTier::Critical) {
            return make_reason(it, ExclusionKind::SensitiveDomainProtection, LimitScope::Domain,
                               "Domain '" + dname + "' protected from flooding (non-critical item)");
        }

        return std::nullopt;
    };

    for (const auto& it : sort_for_admission(items)) {
        auto rejected = check(it);
        if (rejected) {
            res.excluded.push_back(std::move(*rejected));
            continue;
        }

        Usage& du = domain_usage[domain_label(it.candidate)];
        du.items++;
        du.chars += it.char_count;
        total.items++;
        total.chars += it.char_count;

        res.included.push_back(it);
    }

    return res;
}

}  // namespace ctxwin
