#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>

#include "ctxwin/Models.hpp"

namespace ctxwin {

// Thrown for malformed budget tables (negative caps, thresholds out of range, ...).
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

struct DomainBudget {
    int max_items = 0;
    int max_chars = 0;
    int min_relevance = 0;      // 0..100
    int min_confidence = 0;     // 0..100
};

// Informational ratios; they are reported, never used to gate admission.
struct MemoryTypeWeights {
    double recent = 0.5;
    double long_term = 0.35;
    double pattern = 0.15;
};

struct SaturationThresholds {
    double redundancy_similarity = 0.85;   // similarity >= this is redundant
    int topic_repetition_limit = 8;        // more than this many items per topic saturates
    double min_diversity_score = 0.3;      // reported as metrics.min_diversity_met
    double similarity_down_weight = 0.7;
};

enum class DecayCurve {
    Exponential,
    Linear
};

const char* decay_curve_name(DecayCurve c);
std::optional<DecayCurve> parse_decay_curve(const std::string& s);

struct DecayConfig {
    DecayCurve curve = DecayCurve::Exponential;
    double half_life_hours = 336.0;   // exponential: factor halves every half-life
    double window_hours = 336.0;      // linear: factor reaches 0 after the window
    double floor = 0.5;
};

// What to do with a domain tag that is not part of the fixed enumeration.
struct UnknownDomainPolicy {
    bool reject = false;
    Domain fallback = Domain::Conversation;
};

struct BudgetConfig {
    int total_budget_chars = 10000;
    int total_item_limit = 50;

    std::array<DomainBudget, kDomainCount> domain_budgets{};

    MemoryTypeWeights memory_type_weights;
    SaturationThresholds saturation;
    DecayConfig decay;

    std::set<Domain> sensitive_domains;
    int sensitive_domain_item_limit = 3;

    // never topic-capped
    std::set<Domain> topic_exempt_domains;

    UnknownDomainPolicy unknown_domain;
};

// Built-in reference table.
BudgetConfig default_budget_config();

const DomainBudget& budget_for(const BudgetConfig& cfg, Domain d);
DomainBudget& budget_for(BudgetConfig& cfg, Domain d);

// Maps a raw domain tag onto the enumeration, applying cfg.unknown_domain.
// Returns nullopt only when the tag is unknown and the policy rejects it.
std::optional<Domain> resolve_domain(const std::string& tag, const BudgetConfig& cfg);

void validate_config(const BudgetConfig& cfg);

struct DomainBudgetOverride {
    std::optional<int> max_items;
    std::optional<int> max_chars;
    std::optional<int> min_relevance;
    std::optional<int> min_confidence;
};

// Partial configuration; unset fields keep the base value.
struct ConfigOverride {
    std::optional<int> total_budget_chars;
    std::optional<int> total_item_limit;

    std::map<Domain, DomainBudgetOverride> domain_budgets;

    std::optional<MemoryTypeWeights> memory_type_weights;

    std::optional<double> redundancy_similarity;
    std::optional<int> topic_repetition_limit;
    std::optional<double> min_diversity_score;
    std::optional<double> similarity_down_weight;

    std::optional<DecayConfig> decay;

    std::optional<std::set<Domain>> sensitive_domains;
    std::optional<int> sensitive_domain_item_limit;
    std::optional<std::set<Domain>> topic_exempt_domains;

    std::optional<UnknownDomainPolicy> unknown_domain;
};

BudgetConfig merge_config(const BudgetConfig& base, const ConfigOverride& o);

// Live configuration with snapshot-on-read semantics: readers get an immutable
// shared_ptr that later updates never touch.
class ConfigStore {
public:
    ConfigStore();
    explicit ConfigStore(BudgetConfig cfg);

    std::shared_ptr<const BudgetConfig> snapshot() const;
    BudgetConfig get_config() const;

    // merge + validate; on ConfigError the live config is unchanged
    void update_config(const ConfigOverride& o);
    void replace_config(BudgetConfig cfg);

    uint64_t version() const;

private:
    mutable std::shared_mutex mu_;
    std::shared_ptr<const BudgetConfig> current_;
    uint64_t version_ = 1;
};

}  // namespace ctxwin
