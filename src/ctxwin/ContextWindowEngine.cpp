#include "ctxwin/ContextWindowEngine.hpp"

#include <chrono>
#include <utility>

#include "ctxwin/Metrics.hpp"
#include "ctxwin/Saturation.hpp"
#include "ctxwin/Scorer.hpp"
#include "ctxwin/Selector.hpp"

namespace ctxwin {

ContextWindowEngine::ContextWindowEngine() : ContextWindowEngine(EngineOptions{}) {}

ContextWindowEngine::ContextWindowEngine(EngineOptions opts)
    : config_(std::move(opts.config)),
      log_(std::move(opts.log)),
      similarity_(std::move(opts.similarity)),
      topics_(std::move(opts.topics)) {
    if (!similarity_) similarity_ = std::make_shared<LexicalSimilarity>();
    if (!topics_) topics_ = std::make_shared<KeywordTopicExtractor>();
}

SelectionResult ContextWindowEngine::select_context(const std::vector<Candidate>& candidates,
                                                    int quality_score,
                                                    const SelectionContext& ctx,
                                                    TimePoint now) const {
    const auto started = std::chrono::steady_clock::now();
    const std::shared_ptr<const BudgetConfig> cfg = config_.snapshot();

    const std::vector<EnrichedItem> enriched = enrich_candidates(candidates, quality_score, *cfg, now);

    SelectorResult admitted = select_items(enriched, *cfg);
    SaturationResult saturated = desaturate(admitted.included, *cfg, *similarity_, *topics_);

    SelectionResult result;
    result.included = std::move(saturated.final_items);
    result.excluded = std::move(admitted.excluded);
    for (auto& ex : saturated.excluded) result.excluded.push_back(std::move(ex));
    result.selected_at = now;
    result.deterministic = true;

    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
    result.metrics = build_metrics(result.included, result.excluded, saturated.diversity_score,
                                   *cfg, elapsed.count());

    if (log_) log_->append(ctx, result, cfg);

    return result;
}

SelectionResult ContextWindowEngine::select_context(const std::vector<Candidate>& candidates,
                                                    int quality_score,
                                                    const SelectionContext& ctx) const {
    return select_context(candidates, quality_score, ctx, Clock::now());
}

}  // namespace ctxwin
