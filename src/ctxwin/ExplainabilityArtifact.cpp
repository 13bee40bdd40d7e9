#include "ctxwin/ExplainabilityArtifact.hpp"

#include <fstream>
#include <stdexcept>

#include "ctxwin/Metrics.hpp"
#include "ctxwin/TimeUtil.hpp"
#include "io/JsonIO.hpp"

namespace ctxwin {

nlohmann::json enriched_item_to_json(const EnrichedItem& it) {
    nlohmann::json j;

    j["id"] = it.candidate.id;
    j["domain"] = domain_label(it.candidate);
    j["content"] = it.candidate.content;
    j["importance"] = it.candidate.importance;
    j["occurred_at"] = format_iso8601(it.candidate.occurred_at);
    j["source"] = it.candidate.source;

    j["relevance_score"] = it.relevance_score;
    j["confidence_score"] = it.confidence_score;
    j["priority_tier"] = priority_tier_name(it.priority_tier);
    j["memory_type"] = memory_type_name(it.memory_type);
    j["char_count"] = it.char_count;
    j["diversity_score"] = it.diversity_score;

    return j;
}

nlohmann::json exclusion_to_json(const ExclusionReason& ex) {
    nlohmann::json j;

    j["item_id"] = ex.item_id;
    j["domain"] = domain_label(ex);
    j["reason"] = exclusion_kind_name(ex.kind);
    if (ex.scope != LimitScope::None) j["scope"] = limit_scope_name(ex.scope);
    j["explanation"] = ex.explanation;

    if (ex.relevance_score) j["relevance_score"] = *ex.relevance_score;
    if (ex.confidence_score) j["confidence_score"] = *ex.confidence_score;
    if (ex.similar_to) j["similarity_to"] = *ex.similar_to;
    if (ex.similarity) j["similarity"] = *ex.similarity;
    if (ex.topic) j["topic"] = *ex.topic;

    return j;
}

nlohmann::json metrics_to_json(const SelectionMetrics& m, bool include_timing) {
    nlohmann::json j;

    j["total_chars"] = m.total_chars;
    j["total_items"] = m.total_items;

    auto usage_row = [](const DomainMetrics& dm) {
        return nlohmann::json{
            {"item_count", dm.item_count},
            {"char_count", dm.char_count},
            {"budget_utilization", dm.budget_utilization},
            {"char_utilization", dm.char_utilization},
            {"excluded_count", dm.excluded_count}
        };
    };

    nlohmann::json usage = nlohmann::json::object();
    for (Domain d : all_domains()) {
        usage[domain_name(d)] = usage_row(m.domain_usage[domain_index(d)]);
    }
    for (const auto& kv : m.unmapped_domain_usage) {
        usage[kv.first] = usage_row(kv.second);
    }
    j["domain_usage"] = usage;

    j["budget_utilization"] = m.budget_utilization;
    j["item_utilization"] = m.item_utilization;
    j["diversity_score"] = m.diversity_score;
    j["min_diversity_met"] = m.min_diversity_met;
    j["excluded_count"] = m.excluded_count;
    j["avg_relevance_score"] = m.avg_relevance_score;
    j["avg_confidence_score"] = m.avg_confidence_score;

    j["memory_types"] = {
        {memory_type_name(MemoryType::Recent), m.memory_type_counts[static_cast<size_t>(MemoryType::Recent)]},
        {memory_type_name(MemoryType::LongTerm), m.memory_type_counts[static_cast<size_t>(MemoryType::LongTerm)]},
        {memory_type_name(MemoryType::Pattern), m.memory_type_counts[static_cast<size_t>(MemoryType::Pattern)]}
    };

    if (include_timing) j["processing_time_ms"] = m.processing_time_ms;

    return j;
}

nlohmann::json selection_result_to_json(const SelectionResult& r, bool include_timing) {
    nlohmann::json j;

    nlohmann::json inc = nlohmann::json::array();
    for (const auto& it : r.included) inc.push_back(enriched_item_to_json(it));
    j["included_items"] = inc;

    nlohmann::json exc = nlohmann::json::array();
    for (const auto& ex : r.excluded) exc.push_back(exclusion_to_json(ex));
    j["excluded_items"] = exc;

    nlohmann::json summary = nlohmann::json::object();
    for (const auto& kv : exclusion_summary(r.excluded)) summary[exclusion_kind_name(kv.first)] = kv.second;
    j["exclusion_summary"] = summary;

    j["metrics"] = metrics_to_json(r.metrics, include_timing);
    j["selected_at"] = format_iso8601(r.selected_at);
    j["deterministic"] = r.deterministic;

    return j;
}

static nlohmann::json context_to_json(const SelectionContext& c) {
    return {
        {"turn_id", c.turn_id},
        {"user_id", c.user_id},
        {"tenant_id", c.tenant_id}
    };
}

nlohmann::json log_entry_to_json(const SelectionLogEntry& e) {
    nlohmann::json j;

    j["log_id"] = e.log_id;
    j["context"] = context_to_json(e.context);
    j["timestamp"] = format_iso8601(e.timestamp);
    j["result"] = selection_result_to_json(e.result);
    if (e.config_snapshot) j["config_snapshot"] = jsonio::config_to_json(*e.config_snapshot);

    return j;
}

nlohmann::json ExplainabilityArtifact::to_json() const {
    nlohmann::json j;

    j["candidates_path"] = candidates_path;
    j["config_path"] = config_path;
    j["quality_score"] = quality_score;
    j["context"] = context_to_json(context);
    j["config"] = jsonio::config_to_json(config);
    j["selection"] = selection_result_to_json(result);

    return j;
}

void ExplainabilityArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace ctxwin
