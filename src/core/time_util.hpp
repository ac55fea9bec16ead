/**
 * ============================================================================
 * SOFTWARE: LedgerGate: Period Lock & Posting Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: time_util.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Calendar dates, accounting periods and UTC timestamps. All effective dates
 * that reach the lock check are parsed by parse_effective_date() and nowhere
 * else.
 * ============================================================================
 */

#ifndef LGATE_TIME_UTIL_HPP
#define LGATE_TIME_UTIL_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lgate {

    typedef std::chrono::system_clock::time_point Timestamp;

    // Injected into every service that reads the time.
    typedef std::function<Timestamp()> Clock;

    Clock system_clock_source();

    struct CivilDate {
        int year = 1970;
        int month = 1;
        int day = 1;
    };

    bool operator==(const CivilDate& a, const CivilDate& b);
    bool operator<(const CivilDate& a, const CivilDate& b);

    bool is_valid_date(const CivilDate& d);

    // Days since 1970-01-01 (proleptic Gregorian).
    int64_t days_from_civil(const CivilDate& d);
    CivilDate civil_from_days(int64_t days);

    CivilDate add_days(const CivilDate& d, int64_t days);

    // to - from, in days.
    int64_t days_between(const CivilDate& from, const CivilDate& to);

    // Strict "YYYY-MM-DD".
    std::optional<CivilDate> parse_iso_date(const std::string& text);

    /**
     * @brief The single parser for transaction effective dates.
     * Accepts "YYYY-MM-DD" and ISO-8601 datetimes ("2025-06-15T10:30:00Z",
     * "2025-06-15T10:30:00.123+05:30", "2025-06-15 10:30"). The calendar
     * date is taken as written; offsets are not applied.
     * If the full form does not parse but the first ten characters are a
     * valid date, that date is used and a WARN line is logged.
     * @return nullopt when no date can be recovered.
     */
    std::optional<CivilDate> parse_effective_date(const std::string& text);

    std::string format_date(const CivilDate& d);

    // "YYYY-MM" of the date.
    std::string period_of(const CivilDate& d);

    std::string make_period(int year, int month);

    // "YYYY-MM" with year 2000..2099 and month 01..12.
    bool is_valid_period(const std::string& period);

    // "2025-06-15T10:30:00Z"
    std::string to_iso8601(Timestamp ts);

    // Reads what to_iso8601 writes; also accepts fractional seconds and
    // "+00:00" style offsets.
    std::optional<Timestamp> parse_iso8601(const std::string& text);

    CivilDate utc_date(Timestamp ts);

} // namespace lgate

#endif // LGATE_TIME_UTIL_HPP
