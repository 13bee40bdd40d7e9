#pragma once

#include "ctxwin/Models.hpp"

namespace ctxwin {

struct Classification {
    PriorityTier tier = PriorityTier::Optional;
    MemoryType memory_type = MemoryType::LongTerm;
};

// Identity facts and high-importance items are critical; moderate importance and
// low-importance facts in core personal domains are relevant; the rest optional.
PriorityTier classify_priority_tier(const Candidate& c);

// recent (< 24h before now), pattern (habitual language), otherwise long_term
MemoryType classify_memory_type(const Candidate& c, TimePoint now);

Classification classify(const Candidate& c, TimePoint now);

// hours between occurred_at and now; negative for future timestamps
double age_hours(const Candidate& c, TimePoint now);

}  // namespace ctxwin
