#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"
#include "ctxwin/SelectionLog.hpp"

namespace ctxwin {

nlohmann::json enriched_item_to_json(const EnrichedItem& it);
nlohmann::json exclusion_to_json(const ExclusionReason& ex);
nlohmann::json metrics_to_json(const SelectionMetrics& m, bool include_timing = true);

// include_timing=false drops processing_time_ms, the only field that differs
// between two runs over the same input
nlohmann::json selection_result_to_json(const SelectionResult& r, bool include_timing = true);

nlohmann::json log_entry_to_json(const SelectionLogEntry& e);

struct ExplainabilityArtifact {
    std::string candidates_path;
    std::string config_path;
    int quality_score = 50;

    SelectionContext context;
    BudgetConfig config;
    SelectionResult result;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace ctxwin
