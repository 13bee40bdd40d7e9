#include "ctxwin/BudgetConfig.hpp"

#include <mutex>
#include <utility>

#include "text/TextUtil.hpp"

namespace ctxwin {

const char* decay_curve_name(DecayCurve c) {
    switch (c) {
        case DecayCurve::Exponential: return "exponential";
        case DecayCurve::Linear: return "linear";
    }
    return "unknown";
}

std::optional<DecayCurve> parse_decay_curve(const std::string& s) {
    const std::string key = textutil::to_lower_ascii(s);
    if (key == "exponential") return DecayCurve::Exponential;
    if (key == "linear") return DecayCurve::Linear;
    return std::nullopt;
}

BudgetConfig default_budget_config() {
    BudgetConfig cfg;
    cfg.total_budget_chars = 10000;
    cfg.total_item_limit = 50;

    // identity facets are numerous (name, hometown, employer, ...) so personal gets the most room
    budget_for(cfg, Domain::Personal)         = DomainBudget{15, 2500, 10, 0};
    budget_for(cfg, Domain::Relationships)    = DomainBudget{10, 1500, 15, 0};
    budget_for(cfg, Domain::Health)           = DomainBudget{4, 800, 40, 40};
    budget_for(cfg, Domain::Goals)            = DomainBudget{3, 600, 40, 30};
    budget_for(cfg, Domain::Preferences)      = DomainBudget{4, 600, 35, 30};
    budget_for(cfg, Domain::Conversation)     = DomainBudget{5, 1000, 30, 20};
    budget_for(cfg, Domain::Tasks)            = DomainBudget{3, 400, 50, 40};
    budget_for(cfg, Domain::Community)        = DomainBudget{2, 300, 50, 50};
    budget_for(cfg, Domain::EventsMeetups)    = DomainBudget{2, 300, 50, 50};
    budget_for(cfg, Domain::ProductsServices) = DomainBudget{2, 200, 60, 50};
    budget_for(cfg, Domain::Notes)            = DomainBudget{2, 200, 50, 40};

    cfg.memory_type_weights = MemoryTypeWeights{0.5, 0.35, 0.15};
    cfg.saturation = SaturationThresholds{0.85, 8, 0.3, 0.7};
    cfg.decay = DecayConfig{};

    cfg.sensitive_domains = {Domain::Health};
    cfg.sensitive_domain_item_limit = 3;
    cfg.topic_exempt_domains = {Domain::Personal, Domain::Relationships};

    cfg.unknown_domain = UnknownDomainPolicy{false, Domain::Conversation};
    return cfg;
}

const DomainBudget& budget_for(const BudgetConfig& cfg, Domain d) {
    return cfg.domain_budgets[domain_index(d)];
}

DomainBudget& budget_for(BudgetConfig& cfg, Domain d) {
    return cfg.domain_budgets[domain_index(d)];
}

std::optional<Domain> resolve_domain(const std::string& tag, const BudgetConfig& cfg) {
    auto d = parse_domain(tag);
    if (d) return d;
    if (cfg.unknown_domain.reject) return std::nullopt;
    return cfg.unknown_domain.fallback;
}

static void require(bool ok, const std::string& msg) {
    if (!ok) throw ConfigError("invalid context budget config: " + msg);
}

static bool in_unit(double x) { return x >= 0.0 && x <= 1.0; }
static bool in_percent(int x) { return x >= 0 && x <= 100; }

void validate_config(const BudgetConfig& cfg) {
    require(cfg.total_budget_chars > 0, "total_budget_chars must be > 0");
    require(cfg.total_item_limit > 0, "total_item_limit must be > 0");

    for (Domain d : all_domains()) {
        const DomainBudget& b = budget_for(cfg, d);
        const std::string where = std::string("domain_budgets.") + domain_name(d);

        require(b.max_items >= 0, where + ".max_items must be >= 0");
        require(b.max_chars >= 0, where + ".max_chars must be >= 0");
        require(in_percent(b.min_relevance), where + ".min_relevance must be in [0,100]");
        require(in_percent(b.min_confidence), where + ".min_confidence must be in [0,100]");
    }

    const MemoryTypeWeights& w = cfg.memory_type_weights;
    require(w.recent >= 0.0 && w.long_term >= 0.0 && w.pattern >= 0.0,
            "memory_type_weights must be non-negative");

    const SaturationThresholds& s = cfg.saturation;
    require(s.redundancy_similarity > 0.0 && s.redundancy_similarity <= 1.0,
            "saturation.redundancy_similarity must be in (0,1]");
    require(s.topic_repetition_limit >= 0, "saturation.topic_repetition_limit must be >= 0");
    require(in_unit(s.min_diversity_score), "saturation.min_diversity_score must be in [0,1]");
    require(in_unit(s.similarity_down_weight), "saturation.similarity_down_weight must be in [0,1]");

    require(cfg.decay.half_life_hours > 0.0, "decay.half_life_hours must be > 0");
    require(cfg.decay.window_hours > 0.0, "decay.window_hours must be > 0");
    require(in_unit(cfg.decay.floor), "decay.floor must be in [0,1]");

    require(cfg.sensitive_domain_item_limit >= 0, "sensitive_domain_item_limit must be >= 0");
}

BudgetConfig merge_config(const BudgetConfig& base, const ConfigOverride& o) {
    BudgetConfig out = base;

    if (o.total_budget_chars) out.total_budget_chars = *o.total_budget_chars;
    if (o.total_item_limit) out.total_item_limit = *o.total_item_limit;

    for (const auto& kv : o.domain_budgets) {
        DomainBudget& b = budget_for(out, kv.first);
        const DomainBudgetOverride& ov = kv.second;
        if (ov.max_items) b.max_items = *ov.max_items;
        if (ov.max_chars) b.max_chars = *ov.max_chars;
        if (ov.min_relevance) b.min_relevance = *ov.min_relevance;
        if (ov.min_confidence) b.min_confidence = *ov.min_confidence;
    }

    if (o.memory_type_weights) out.memory_type_weights = *o.memory_type_weights;

    if (o.redundancy_similarity) out.saturation.redundancy_similarity = *o.redundancy_similarity;
    if (o.topic_repetition_limit) out.saturation.topic_repetition_limit = *o.topic_repetition_limit;
    if (o.min_diversity_score) out.saturation.min_diversity_score = *o.min_diversity_score;
    if (o.similarity_down_weight) out.saturation.similarity_down_weight = *o.similarity_down_weight;

    if (o.decay) out.decay = *o.decay;

    if (o.sensitive_domains) out.sensitive_domains = *o.sensitive_domains;
    if (o.sensitive_domain_item_limit) out.sensitive_domain_item_limit = *o.sensitive_domain_item_limit;
    if (o.topic_exempt_domains) out.topic_exempt_domains = *o.topic_exempt_domains;

    if (o.unknown_domain) out.unknown_domain = *o.unknown_domain;

    return out;
}

ConfigStore::ConfigStore() : ConfigStore(default_budget_config()) {}

ConfigStore::ConfigStore(BudgetConfig cfg) {
    validate_config(cfg);
    current_ = std::make_shared<const BudgetConfig>(std::move(cfg));
}

std::shared_ptr<const BudgetConfig> ConfigStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return current_;
}

BudgetConfig ConfigStore::get_config() const {
    return *snapshot();
}

void ConfigStore::update_config(const ConfigOverride& o) {
    std::unique_lock<std::shared_mutex> lock(mu_);

    BudgetConfig next = merge_config(*current_, o);
    validate_config(next);

    current_ = std::make_shared<const BudgetConfig>(std::move(next));
    ++version_;
}

void ConfigStore::replace_config(BudgetConfig cfg) {
    validate_config(cfg);
    auto next = std::make_shared<const BudgetConfig>(std::move(cfg));

    std::unique_lock<std::shared_mutex> lock(mu_);
    current_ = std::move(next);
    ++version_;
}

uint64_t ConfigStore::version() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return version_;
}

}  // namespace ctxwin
