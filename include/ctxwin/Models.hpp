#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ctxwin {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Domain {
    Personal,
    Relationships,
    Health,
    Goals,
    Preferences,
    Conversation,
    Tasks,
    Community,
    EventsMeetups,
    ProductsServices,
    Notes
};

constexpr size_t kDomainCount = 11;

const std::array<Domain, kDomainCount>& all_domains();
constexpr size_t domain_index(Domain d) { return static_cast<size_t>(d); }

const char* domain_name(Domain d);
// accepts canonical names plus "events" / "products"; case-insensitive
std::optional<Domain> parse_domain(const std::string& s);

enum class PriorityTier {
    Critical,
    Relevant,
    Optional
};

enum class MemoryType {
    Recent,
    LongTerm,
    Pattern
};

enum class Provenance {
    System,
    TypedText,
    VoiceTranscript,
    Other
};

const char* priority_tier_name(PriorityTier t);
const char* memory_type_name(MemoryType t);
Provenance parse_provenance(const std::string& source);

struct Candidate {
    std::string id;                     // unique within one call
    Domain domain = Domain::Conversation;
    // raw tag when it is not one of the enumerated domains; domain then only
    // names the budget the item borrows
    std::string domain_tag;
    std::string content;
    int importance = 0;                 // 0..100, assigned upstream
    TimePoint occurred_at{};
    std::string source;                 // "system", "orb_text", "orb_voice", ...
};

// true when the item carries one of the enumerated domains
inline bool has_known_domain(const Candidate& c) { return c.domain_tag.empty(); }

// the tag the item is counted and reported under
std::string domain_label(const Candidate& c);

struct EnrichedItem {
    Candidate candidate;

    int relevance_score = 0;            // 0..100
    int confidence_score = 0;           // 0..100
    PriorityTier priority_tier = PriorityTier::Optional;
    MemoryType memory_type = MemoryType::LongTerm;
    int char_count = 0;                 // code points of content

    // set by the saturation pass to the diversity of the final set
    double diversity_score = 1.0;
};

enum class ExclusionKind {
    DomainCapExceeded,
    TotalCapExceeded,
    BelowRelevanceThreshold,
    BelowConfidenceThreshold,
    RedundantContent,
    TopicSaturation,
    CharLimitExceeded,
    SensitiveDomainProtection
};

constexpr size_t kExclusionKindCount = 8;

const char* exclusion_kind_name(ExclusionKind k);

// which budget a cap/limit exclusion was measured against
enum class LimitScope {
    None,
    Domain,
    Global
};

const char* limit_scope_name(LimitScope s);

struct ExclusionReason {
    std::string item_id;
    Domain domain = Domain::Conversation;
    std::string domain_tag;             // copied from the candidate
    ExclusionKind kind = ExclusionKind::TotalCapExceeded;
    LimitScope scope = LimitScope::None;
    std::string explanation;

    std::optional<int> relevance_score;
    std::optional<int> confidence_score;

    // redundant_content only: the finalized item this one duplicates
    std::optional<std::string> similar_to;
    std::optional<double> similarity;

    // topic_saturation only
    std::optional<std::string> topic;
};

std::string domain_label(const ExclusionReason& r);

struct DomainMetrics {
    int item_count = 0;
    int char_count = 0;
    double budget_utilization = 0.0;    // items / max_items
    double char_utilization = 0.0;      // chars / max_chars
    int excluded_count = 0;
};

struct SelectionMetrics {
    int total_chars = 0;
    int total_items = 0;
    std::array<DomainMetrics, kDomainCount> domain_usage{};
    // unknown tags, measured against the budget of the domain they fell back to
    std::map<std::string, DomainMetrics> unmapped_domain_usage;
    double budget_utilization = 0.0;    // chars / total_budget_chars
    double item_utilization = 0.0;      // items / total_item_limit
    double diversity_score = 1.0;
    bool min_diversity_met = true;
    int excluded_count = 0;
    double avg_relevance_score = 0.0;
    double avg_confidence_score = 0.0;
    std::array<int, 3> memory_type_counts{};  // indexed by MemoryType
    double processing_time_ms = 0.0;
};

struct SelectionResult {
    std::vector<EnrichedItem> included;      // admission order
    std::vector<ExclusionReason> excluded;   // selector first, then saturation
    SelectionMetrics metrics;
    TimePoint selected_at{};
    bool deterministic = true;
};

}  // namespace ctxwin
