#include "ctxwin/Models.hpp"

#include "text/TextUtil.hpp"

namespace ctxwin {

const std::array<Domain, kDomainCount>& all_domains() {
    static const std::array<Domain, kDomainCount> domains = {
        Domain::Personal,
        Domain::Relationships,
        Domain::Health,
        Domain::Goals,
        Domain::Preferences,
        Domain::Conversation,
        Domain::Tasks,
        Domain::Community,
        Domain::EventsMeetups,
        Domain::ProductsServices,
        Domain::Notes,
    };
    return domains;
}

const char* domain_name(Domain d) {
    switch (d) {
        case Domain::Personal: return "personal";
        case Domain::Relationships: return "relationships";
        case Domain::Health: return "health";
        case Domain::Goals: return "goals";
        case Domain::Preferences: return "preferences";
        case Domain::Conversation: return "conversation";
        case Domain::Tasks: return "tasks";
        case Domain::Community: return "community";
        case Domain::EventsMeetups: return "events_meetups";
        case Domain::ProductsServices: return "products_services";
        case Domain::Notes: return "notes";
    }
    return "unknown";
}

std::optional<Domain> parse_domain(const std::string& s) {
    const std::string key = textutil::to_lower_ascii(s);

    for (Domain d : all_domains()) {
        if (key == domain_name(d)) return d;
    }
    if (key == "events") return Domain::EventsMeetups;
    if (key == "products") return Domain::ProductsServices;
    return std::nullopt;
}

std::string domain_label(const Candidate& c) {
    return c.domain_tag.empty() ? std::string(domain_name(c.domain)) : c.domain_tag;
}

std::string domain_label(const ExclusionReason& r) {
    return r.domain_tag.empty() ? std::string(domain_name(r.domain)) : r.domain_tag;
}

const char* priority_tier_name(PriorityTier t) {
    switch (t) {
        case PriorityTier::Critical: return "critical";
        case PriorityTier::Relevant: return "relevant";
        case PriorityTier::Optional: return "optional";
    }
    return "unknown";
}

const char* memory_type_name(MemoryType t) {
    switch (t) {
        case MemoryType::Recent: return "recent";
        case MemoryType::LongTerm: return "long_term";
        case MemoryType::Pattern: return "pattern";
    }
    return "unknown";
}

Provenance parse_provenance(const std::string& source) {
    const std::string key = textutil::to_lower_ascii(source);
    if (key == "system") return Provenance::System;
    if (key == "orb_text" || key == "text") return Provenance::TypedText;
    if (key == "orb_voice" || key == "voice") return Provenance::VoiceTranscript;
    return Provenance::Other;
}

const char* exclusion_kind_name(ExclusionKind k) {
    switch (k) {
        case ExclusionKind::DomainCapExceeded: return "domain_cap_exceeded";
        case ExclusionKind::TotalCapExceeded: return "total_cap_exceeded";
        case ExclusionKind::BelowRelevanceThreshold: return "below_relevance_threshold";
        case ExclusionKind::BelowConfidenceThreshold: return "below_confidence_threshold";
        case ExclusionKind::RedundantContent: return "redundant_content";
        case ExclusionKind::TopicSaturation: return "topic_saturation";
        case ExclusionKind::CharLimitExceeded: return "char_limit_exceeded";
        case ExclusionKind::SensitiveDomainProtection: return "sensitive_domain_protection";
    }
    return "unknown";
}

const char* limit_scope_name(LimitScope s) {
    switch (s) {
        case LimitScope::None: return "none";
        case LimitScope::Domain: return "domain";
        case LimitScope::Global: return "global";
    }
    return "unknown";
}

}  // namespace ctxwin
