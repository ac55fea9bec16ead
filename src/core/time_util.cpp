/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: time_util.cpp
 * ============================================================================
 */

#include "time_util.hpp"
#include "logger.hpp"
#include <cstdio>

namespace lgate {

namespace {

    bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
        if (pos + count > s.size()) return false;
        int value = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            if (s[i] < '0' || s[i] > '9') return false;
            value = value * 10 + (s[i] - '0');
        }
        out = value;
        return true;
    }

    int days_in_month(int year, int month) {
        static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2) {
            bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return leap ? 29 : 28;
        }
        return table[month - 1];
    }

    int64_t floor_div(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }

    struct ParsedDateTime {
        CivilDate date;
        int hour = 0;
        int minute = 0;
        int second = 0;
        int offset_seconds = 0;
    };

    // date [T|' ' HH:MM[:SS[.fff]] [Z|+HH:MM|-HH:MM|+HHMM]]
    bool parse_full(const std::string& s, ParsedDateTime& out) {
        int y, mo, d;
        if (s.size() < 10 || s[4] != '-' || s[7] != '-') return false;
        if (!read_digits(s, 0, 4, y) || !read_digits(s, 5, 2, mo) || !read_digits(s, 8, 2, d)) return false;
        out.date = CivilDate{y, mo, d};
        if (!is_valid_date(out.date)) return false;
        if (s.size() == 10) return true;

        if (s[10] != 'T' && s[10] != ' ') return false;
        size_t pos = 11;
        if (!read_digits(s, pos, 2, out.hour) || pos + 2 >= s.size() || s[pos + 2] != ':') return false;
        if (!read_digits(s, pos + 3, 2, out.minute)) return false;
        pos += 5;

        if (pos < s.size() && s[pos] == ':') {
            if (!read_digits(s, pos + 1, 2, out.second)) return false;
            pos += 3;
            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                size_t start = pos;
                while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
                if (pos == start) return false;
            }
        }
        if (out.hour > 23 || out.minute > 59 || out.second > 60) return false;

        if (pos == s.size()) return true;
        if (s[pos] == 'Z' || s[pos] == 'z') return pos + 1 == s.size();
        if (s[pos] != '+' && s[pos] != '-') return false;

        int sign = s[pos] == '-' ? -1 : 1;
        int oh, om;
        if (!read_digits(s, pos + 1, 2, oh)) return false;
        size_t mpos = pos + 3;
        if (mpos < s.size() && s[mpos] == ':') ++mpos;
        if (!read_digits(s, mpos, 2, om) || mpos + 2 != s.size()) return false;
        if (oh > 23 || om > 59) return false;
        out.offset_seconds = sign * (oh * 3600 + om * 60);
        return true;
    }

} // namespace

Clock system_clock_source() {
    // Whole seconds, the resolution timestamps are stored at.
    return []() -> Timestamp {
        return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
    };
}

bool operator==(const CivilDate& a, const CivilDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator<(const CivilDate& a, const CivilDate& b) {
    return days_from_civil(a) < days_from_civil(b);
}

bool is_valid_date(const CivilDate& d) {
    if (d.year < 1 || d.year > 9999) return false;
    if (d.month < 1 || d.month > 12) return false;
    return d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

int64_t days_from_civil(const CivilDate& d) {
    int64_t y = d.year - (d.month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t doy = (153 * (d.month + (d.month > 2 ? -3 : 9)) + 2) / 5 + d.day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t z) {
    z += 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d)};
}

CivilDate add_days(const CivilDate& d, int64_t days) {
    return civil_from_days(days_from_civil(d) + days);
}

int64_t days_between(const CivilDate& from, const CivilDate& to) {
    return days_from_civil(to) - days_from_civil(from);
}

std::optional<CivilDate> parse_iso_date(const std::string& text) {
    ParsedDateTime parsed;
    if (text.size() != 10 || !parse_full(text, parsed)) return std::nullopt;
    return parsed.date;
}

std::optional<CivilDate> parse_effective_date(const std::string& text) {
    ParsedDateTime parsed;
    if (parse_full(text, parsed)) return parsed.date;

    if (text.size() > 10) {
        std::optional<CivilDate> leading = parse_iso_date(text.substr(0, 10));
        if (leading) {
            lgate_log("WARN", "Effective date '" + text + "' is not ISO-8601; using leading date " + format_date(*leading));
            return leading;
        }
    }
    return std::nullopt;
}

std::string format_date(const CivilDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return buf;
}

std::string period_of(const CivilDate& d) {
    return make_period(d.year, d.month);
}

std::string make_period(int year, int month) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    return buf;
}

bool is_valid_period(const std::string& period) {
    int y, m;
    if (period.size() != 7 || period[4] != '-') return false;
    if (!read_digits(period, 0, 4, y) || !read_digits(period, 5, 2, m)) return false;
    return y >= 2000 && y <= 2099 && m >= 1 && m <= 12;
}

std::string to_iso8601(Timestamp ts) {
    int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    int64_t days = floor_div(secs, 86400);
    int64_t rem = secs - days * 86400;
    CivilDate d = civil_from_days(days);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", d.year, d.month, d.day,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return buf;
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    ParsedDateTime parsed;
    if (!parse_full(text, parsed)) return std::nullopt;

    int64_t secs = days_from_civil(parsed.date) * 86400 + parsed.hour * 3600 + parsed.minute * 60 + parsed.second -
                   parsed.offset_seconds;
    return Timestamp(std::chrono::seconds(secs));
}

CivilDate utc_date(Timestamp ts) {
    int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    return civil_from_days(floor_div(secs, 86400));
}

} // namespace lgate
