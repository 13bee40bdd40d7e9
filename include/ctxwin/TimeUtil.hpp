#pragma once

#include <optional>
#include <string>

#include "ctxwin/Models.hpp"

namespace ctxwin {

// "2026-01-02T10:00:00Z" / "...T10:00:00.250Z" / "...T10:00:00+02:00" / "2026-01-02"
std::optional<TimePoint> parse_iso8601(const std::string& s);

// UTC, millisecond precision: "2026-01-02T10:00:00.000Z"
std::string format_iso8601(TimePoint t);

// UTC calendar date: "2026-01-02"
std::string format_date(TimePoint t);

}  // namespace ctxwin
