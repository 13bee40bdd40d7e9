#pragma once

#include <map>
#include <string>
#include <vector>

#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"

namespace ctxwin {

// Per-domain and global statistics for a finished selection. Pure aggregation.
SelectionMetrics build_metrics(
    const std::vector<EnrichedItem>& included,
    const std::vector<ExclusionReason>& excluded,
    double diversity_score,
    const BudgetConfig& cfg,
    double processing_time_ms
);

// reason -> count, only reasons that occurred
std::map<ExclusionKind, int> exclusion_summary(const std::vector<ExclusionReason>& excluded);

// Multi-line human readable summary of a result.
std::string format_selection_debug(const SelectionResult& result);

}  // namespace ctxwin
