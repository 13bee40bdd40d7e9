#include "ctxwin/Classifier.hpp"

#include <string>
#include <unordered_set>

#include "text/TextUtil.hpp"

namespace ctxwin {

static bool has_habit_marker(const std::string& content) {
    static const std::unordered_set<std::string> markers = {
        "always", "never", "usually", "prefer", "habit", "routine"
    };

    for (const auto& w : textutil::word_tokens(content)) {
        if (markers.count(w)) return true;
    }
    return false;
}

double age_hours(const Candidate& c, TimePoint now) {
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - c.occurred_at);
    return static_cast<double>(age.count()) / (1000.0 * 60.0 * 60.0);
}

PriorityTier classify_priority_tier(const Candidate& c) {
    const int imp = c.importance;
    // domain rules only apply to enumerated tags
    const bool known = has_known_domain(c);

    if (known && c.domain == Domain::Personal && imp >= 30) return PriorityTier::Critical;
    if (known && c.domain == Domain::Relationships && imp >= 50) return PriorityTier::Critical;
    if (imp >= 70) return PriorityTier::Critical;

    if (imp >= 30) return PriorityTier::Relevant;

    const bool core_domain = known && (
        c.domain == Domain::Health ||
        c.domain == Domain::Goals ||
        c.domain == Domain::Preferences);
    if (core_domain && imp >= 20) return PriorityTier::Relevant;

    return PriorityTier::Optional;
}

MemoryType classify_memory_type(const Candidate& c, TimePoint now) {
    if (age_hours(c, now) < 24.0) return MemoryType::Recent;
    if (has_habit_marker(c.content)) return MemoryType::Pattern;
    return MemoryType::LongTerm;
}

Classification classify(const Candidate& c, TimePoint now) {
    Classification out;
    out.tier = classify_priority_tier(c);
    out.memory_type = classify_memory_type(c, now);
    return out;
}

}  // namespace ctxwin
