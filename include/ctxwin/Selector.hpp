#pragma once

#include <vector>

#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"

namespace ctxwin {

struct SelectorResult {
    std::vector<EnrichedItem> included;          // admission order
    std::vector<ExclusionReason> excluded;       // one per rejected item, in visit order
};

// critical before relevant before optional, then relevance descending.
// Stable: equal keys keep their input order.
std::vector<EnrichedItem> sort_for_admission(std::vector<EnrichedItem> items);

// Single greedy admission pass against per-domain and global budgets.
// Every item ends up in exactly one of included/excluded.
SelectorResult select_items(const std::vector<EnrichedItem>& items, const BudgetConfig& cfg);

}  // namespace ctxwin
