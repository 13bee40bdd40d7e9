#include "ctxwin/TimeUtil.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>

namespace ctxwin {

namespace {

struct CivilDate {
    int64_t y;
    unsigned m;
    unsigned d;
};

// days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const unsigned d = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const unsigned m = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    return CivilDate{yoe + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return days[m - 1];
}

class Cursor {
public:
    explicit Cursor(const std::string& s) : s_(s) {}

    bool done() const { return pos_ >= s_.size(); }
    char peek() const { return done() ? '\0' : s_[pos_]; }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    // exactly n digits
    bool digits(size_t n, int& out) {
        if (pos_ + n > s_.size()) return false;
        int v = 0;
        for (size_t i = 0; i < n; ++i) {
            const char c = s_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            v = v * 10 + (c - '0');
        }
        pos_ += n;
        out = v;
        return true;
    }

    // fractional seconds -> milliseconds (extra precision is dropped)
    int fraction_ms() {
        int ms = 0;
        size_t n = 0;
        while (!done() && std::isdigit(static_cast<unsigned char>(peek()))) {
            if (n < 3) ms = ms * 10 + (peek() - '0');
            ++n;
            ++pos_;
        }
        for (; n < 3; ++n) ms *= 10;
        return ms;
    }

private:
    const std::string& s_;
    size_t pos_ = 0;
};

}  // namespace

std::optional<TimePoint> parse_iso8601(const std::string& s) {
    Cursor c(s);

    int y = 0, mo = 0, d = 0;
    if (!c.digits(4, y) || !c.consume('-') || !c.digits(2, mo) || !c.consume('-') || !c.digits(2, d)) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12) return std::nullopt;
    if (d < 1 || static_cast<unsigned>(d) > days_in_month(y, static_cast<unsigned>(mo))) return std::nullopt;

    int hh = 0, mm = 0, ss = 0, ms = 0;
    int offset_minutes = 0;

    if (!c.done()) {
        if (!c.consume('T') && !c.consume(' ')) return std::nullopt;
        if (!c.digits(2, hh) || !c.consume(':') || !c.digits(2, mm)) return std::nullopt;
        if (c.consume(':')) {
            if (!c.digits(2, ss)) return std::nullopt;
            if (c.consume('.')) ms = c.fraction_ms();
        }
        if (hh > 23 || mm > 59 || ss > 60) return std::nullopt;

        if (c.consume('Z') || c.consume('z')) {
            // utc
        } else if (c.peek() == '+' || c.peek() == '-') {
            const int sign = c.peek() == '-' ? -1 : 1;
            c.consume(c.peek());
            int oh = 0, om = 0;
            if (!c.digits(2, oh)) return std::nullopt;
            c.consume(':');
            if (!c.digits(2, om)) return std::nullopt;
            offset_minutes = sign * (oh * 60 + om);
        }
        if (!c.done()) return std::nullopt;
    }

    const int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    const int64_t secs = days * 86400 + hh * 3600 + mm * 60 + ss - static_cast<int64_t>(offset_minutes) * 60;

    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(secs * 1000 + ms)));
}

std::string format_iso8601(TimePoint t) {
    const int64_t total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    const int64_t days = floor_div(total_ms, 86400000);
    const int64_t day_ms = total_ms - days * 86400000;

    const CivilDate cd = civil_from_days(days);
    const int64_t hh = day_ms / 3600000;
    const int64_t mm = (day_ms / 60000) % 60;
    const int64_t ss = (day_ms / 1000) % 60;
    const int64_t ms = day_ms % 1000;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  static_cast<long long>(cd.y), cd.m, cd.d,
                  static_cast<long long>(hh), static_cast<long long>(mm),
                  static_cast<long long>(ss), static_cast<long long>(ms));
    return buf;
}

std::string format_date(TimePoint t) {
    const int64_t total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    const CivilDate cd = civil_from_days(floor_div(total_ms, 86400000));

    char buf[24];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(cd.y), cd.m, cd.d);
    return buf;
}

}  // namespace ctxwin
