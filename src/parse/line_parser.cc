/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: line_parser.cc
 * Description: Implementation of logcat line parsing and timestamp
 *              normalization. Epoch values are handled as decimal text so that
 *              no binary floating point rounding reaches the ISO timestamp.
 */

#include "lcsee/parse/line_parser.h"
#include "lcsee/parse/grammar.h"
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace lcsee {
namespace parse {

using record::LogFormat;

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int MICROS_DIGITS = 6;

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool to_int32(const std::string& s, int32_t& out) {
    try {
        size_t idx = 0;
        long long v = std::stoll(s, &idx, 10);
        if (idx != s.size()) return false;
        if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
            return false;
        }
        out = static_cast<int32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Two ASCII digits at `pos`; the grammar guarantees they are digits
int two_digits(const std::string& s, size_t pos) {
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

bool is_leap_year(int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int64_t year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

// Proleptic Gregorian date for a count of days since 1970-01-01
void civil_from_days(int64_t days, int64_t& year, int& month, int& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = yoe + era * 400 + (month <= 2 ? 1 : 0);
}

std::string format_iso(int64_t year, int month, int day,
                       int hour, int minute, int second, int64_t micros) {
    std::ostringstream iso;
    iso << std::setfill('0')
        << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day << "T"
        << std::setw(2) << hour << ":"
        << std::setw(2) << minute << ":"
        << std::setw(2) << second << "."
        << std::setw(MICROS_DIGITS) << micros;
    return iso.str();
}

// First six fractional digits, right padded with zeros
int64_t fraction_to_micros(const std::string& fraction) {
    int64_t micros = 0;
    for (int i = 0; i < MICROS_DIGITS; ++i) {
        micros *= 10;
        if (static_cast<size_t>(i) < fraction.size()) {
            micros += fraction[i] - '0';
        }
    }
    return micros;
}

} // namespace

int current_year() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    return local_tm.tm_year + 1900;
}

std::optional<std::string> epoch_to_iso(const std::string& epoch_text) {
    size_t dot = epoch_text.find('.');
    std::string whole = epoch_text.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : epoch_text.substr(dot + 1);

    int64_t seconds = 0;
    try {
        size_t idx = 0;
        seconds = std::stoll(whole, &idx, 10);
        if (idx != whole.size() || seconds < 0) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    int64_t micros = fraction_to_micros(fraction);
    if (fraction.size() > static_cast<size_t>(MICROS_DIGITS) && fraction[MICROS_DIGITS] >= '5') {
        ++micros;
        if (micros == 1000000) {
            micros = 0;
            if (seconds == std::numeric_limits<int64_t>::max()) {
                return std::nullopt;
            }
            ++seconds;
        }
    }

    const int64_t days = seconds / SECONDS_PER_DAY;
    const int64_t second_of_day = seconds % SECONDS_PER_DAY;

    int64_t year = 0;
    int month = 0;
    int day = 0;
    civil_from_days(days, year, month, day);

    return format_iso(year, month, day,
                      static_cast<int>(second_of_day / 3600),
                      static_cast<int>((second_of_day % 3600) / 60),
                      static_cast<int>(second_of_day % 60),
                      micros);
}

std::optional<std::string> date_time_to_iso(int year, const std::string& date,
                                            const std::string& time) {
    // date "MM-DD", time "HH:MM:SS.f+"
    if (date.size() != 5 || time.size() < 10) {
        return std::nullopt;
    }

    const int month = two_digits(date, 0);
    const int day = two_digits(date, 3);
    const int hour = two_digits(time, 0);
    const int minute = two_digits(time, 3);
    const int second = two_digits(time, 6);

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    return format_iso(year, month, day, hour, minute, second,
                      fraction_to_micros(time.substr(9)));
}

std::optional<LogRecord> parse_line(const std::string& line, LogFormat format) {
    return parse_line(line, format, current_year());
}

std::optional<LogRecord> parse_line(const std::string& line, LogFormat format,
                                    int reference_year) {
    auto fields = match_grammar(line, format);
    if (!fields) {
        return std::nullopt;
    }

    std::optional<std::string> ts_iso;
    if (format == LogFormat::Epoch) {
        ts_iso = epoch_to_iso(fields->epoch);
    } else {
        ts_iso = date_time_to_iso(reference_year, fields->date, fields->time);
    }
    if (!ts_iso) {
        return std::nullopt;
    }

    LogRecord record;
    record.set_ts_raw(fields->ts_raw);
    record.set_ts_iso(*ts_iso);

    if (!fields->pid.empty()) {
        int32_t pid = 0;
        if (!to_int32(fields->pid, pid)) {
            return std::nullopt;
        }
        record.set_pid(pid);
    }
    if (!fields->tid.empty()) {
        int32_t tid = 0;
        if (!to_int32(fields->tid, tid)) {
            return std::nullopt;
        }
        record.set_tid(tid);
    }

    record.set_level(std::string(1, fields->level));
    record.set_tag(trim(fields->tag));
    record.set_msg(fields->msg);
    return record;
}

} // namespace parse
} // namespace lcsee
