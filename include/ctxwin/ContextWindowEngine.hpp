#pragma once

#include <memory>
#include <vector>

#include "ctxwin/BudgetConfig.hpp"
#include "ctxwin/Models.hpp"
#include "ctxwin/SelectionLog.hpp"
#include "ctxwin/Similarity.hpp"

namespace ctxwin {

struct EngineOptions {
    BudgetConfig config = default_budget_config();

    // optional; selections are recorded only when set
    std::shared_ptr<SelectionLog> log;

    // lexical defaults when null
    std::shared_ptr<const SimilarityStrategy> similarity;
    std::shared_ptr<const TopicExtractor> topics;
};

// Deterministic context selection: enrich -> budgeted admission -> saturation
// control -> metrics. Each call runs against the config snapshot taken at entry,
// so concurrent update_config() calls never change an in-flight selection.
class ContextWindowEngine {
public:
    ContextWindowEngine();
    explicit ContextWindowEngine(EngineOptions opts);

    SelectionResult select_context(const std::vector<Candidate>& candidates,
                                   int quality_score,
                                   const SelectionContext& ctx,
                                   TimePoint now) const;

    // evaluates at the current system time
    SelectionResult select_context(const std::vector<Candidate>& candidates,
                                   int quality_score = 50,
                                   const SelectionContext& ctx = SelectionContext{}) const;

    BudgetConfig get_config() const { return config_.get_config(); }
    std::shared_ptr<const BudgetConfig> config_snapshot() const { return config_.snapshot(); }

    // throws ConfigError and keeps the previous config when the merge is invalid
    void update_config(const ConfigOverride& o) { config_.update_config(o); }

    const std::shared_ptr<SelectionLog>& log() const { return log_; }

private:
    ConfigStore config_;
    std::shared_ptr<SelectionLog> log_;
    std::shared_ptr<const SimilarityStrategy> similarity_;
    std::shared_ptr<const TopicExtractor> topics_;
};

}  // namespace ctxwin
