#include "ctxwin/Metrics.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace ctxwin {

static double ratio(int used, int max) {
    return max > 0 ? static_cast<double>(used) / static_cast<double>(max) : 0.0;
}

static double round2(double x) {
    return std::floor(x * 100.0 + 0.5) / 100.0;
}

static void fill_utilization(DomainMetrics& dm, const DomainBudget& b) {
    dm.budget_utilization = ratio(dm.item_count, b.max_items);
    dm.char_utilization = ratio(dm.char_count, b.max_chars);
}

SelectionMetrics build_metrics(
    const std::vector<EnrichedItem>& included,
    const std::vector<ExclusionReason>& excluded,
    double diversity_score,
    const BudgetConfig& cfg,
    double processing_time_ms
) {
    SelectionMetrics m;

    long long relevance_sum = 0;
    long long confidence_sum = 0;

    // unknown tags keep their own row; it is measured against the fallback budget
    std::map<std::string, Domain> unmapped_fallback;

    for (const auto& it : included) {
        DomainMetrics* dm = &m.domain_usage[domain_index(it.candidate.domain)];
        if (!has_known_domain(it.candidate)) {
            dm = &m.unmapped_domain_usage[it.candidate.domain_tag];
            unmapped_fallback[it.candidate.domain_tag] = it.candidate.domain;
        }
        dm->item_count++;
        dm->char_count += it.char_count;

        m.total_items++;
        m.total_chars += it.char_count;
        m.memory_type_counts[static_cast<size_t>(it.memory_type)]++;

        relevance_sum += it.relevance_score;
        confidence_sum += it.confidence_score;
    }

    for (const auto& ex : excluded) {
        if (ex.domain_tag.empty()) {
            m.domain_usage[domain_index(ex.domain)].excluded_count++;
        } else {
            m.unmapped_domain_usage[ex.domain_tag].excluded_count++;
            unmapped_fallback[ex.domain_tag] = ex.domain;
        }
    }

    for (Domain d : all_domains()) {
        fill_utilization(m.domain_usage[domain_index(d)], budget_for(cfg, d));
    }
    for (auto& kv : m.unmapped_domain_usage) {
        fill_utilization(kv.second, budget_for(cfg, unmapped_fallback[kv.first]));
    }

    m.budget_utilization = ratio(m.total_chars, cfg.total_budget_chars);
    m.item_utilization = ratio(m.total_items, cfg.total_item_limit);

    m.diversity_score = diversity_score;
    m.min_diversity_met = diversity_score >= cfg.saturation.min_diversity_score;

    m.excluded_count = static_cast<int>(excluded.size());

    if (!included.empty()) {
        const double n = static_cast<double>(included.size());
        m.avg_relevance_score = round2(static_cast<double>(relevance_sum) / n);
        m.avg_confidence_score = round2(static_cast<double>(confidence_sum) / n);
    }

    m.processing_time_ms = processing_time_ms;
    return m;
}

std::map<ExclusionKind, int> exclusion_summary(const std::vector<ExclusionReason>& excluded) {
    std::map<ExclusionKind, int> out;
    for (const auto& ex : excluded) out[ex.kind]++;
    return out;
}

std::string format_selection_debug(const SelectionResult& result) {
    const SelectionMetrics& m = result.metrics;

    std::ostringstream os;
    os << std::fixed << std::setprecision(1);

    os << "=== Context Window Selection Result ===\n";
    os << "Included: " << m.total_items << " items, " << m.total_chars << " chars\n";
    os << "Excluded: " << m.excluded_count << " items\n";
    os << "Diversity: " << m.diversity_score * 100.0 << "%\n";
    os << "Budget Usage: " << m.budget_utilization * 100.0 << "%\n";
    os << "\n";
    os << "Per-Domain Breakdown:\n";

    for (Domain d : all_domains()) {
        const DomainMetrics& dm = m.domain_usage[domain_index(d)];
        if (dm.item_count == 0 && dm.excluded_count == 0) continue;
        os << "  " << domain_name(d) << ": " << dm.item_count << " items, "
           << dm.char_count << " chars (" << dm.excluded_count << " excluded)\n";
    }
    for (const auto& kv : m.unmapped_domain_usage) {
        const DomainMetrics& dm = kv.second;
        os << "  " << kv.first << ": " << dm.item_count << " items, "
           << dm.char_count << " chars (" << dm.excluded_count << " excluded)\n";
    }

    if (!result.excluded.empty()) {
        os << "\n";
        os << "Exclusion Summary:\n";
        for (const auto& kv : exclusion_summary(result.excluded)) {
            os << "  " << exclusion_kind_name(kv.first) << ": " << kv.second << "\n";
        }
    }

    return os.str();
}

}  // namespace ctxwin
