#pragma once

#include <chrono>
#include <string>

#include "ctxwin/Models.hpp"
#include "ctxwin/TimeUtil.hpp"

namespace testsupport {

inline ctxwin::TimePoint fixed_now() {
    return *ctxwin::parse_iso8601("2026-01-15T12:00:00Z");
}

inline ctxwin::TimePoint hours_ago(double h) {
    return fixed_now() - std::chrono::duration_cast<ctxwin::Clock::duration>(
        std::chrono::duration<double, std::ratio<3600>>(h));
}

inline ctxwin::Candidate make_candidate(const std::string& id,
                                        ctxwin::Domain domain,
                                        const std::string& content,
                                        int importance,
                                        double age_hours = 0.0,
                                        const std::string& source = "orb_text") {
    ctxwin::Candidate c;
    c.id = id;
    c.domain = domain;
    c.content = content;
    c.importance = importance;
    c.occurred_at = hours_ago(age_hours);
    c.source = source;
    return c;
}

// distinct enough that no two of these are ever flagged redundant
inline std::string distinct_content(const std::string& prefix, int i) {
    static const char* words[] = {
        "apple", "bicycle", "canyon", "dolphin", "ember", "falcon", "glacier", "harbor",
        "island", "jungle", "kettle", "lantern", "meadow", "nectar", "orchid", "pepper",
        "quartz", "river", "saddle", "tundra", "umbrella", "violet", "walnut", "yonder"
    };
    const int n = static_cast<int>(sizeof(words) / sizeof(words[0]));
    return prefix + " " + words[i % n] + " " + words[(i * 7 + 3) % n] + " " + std::to_string(1000 + i);
}

}  // namespace testsupport
