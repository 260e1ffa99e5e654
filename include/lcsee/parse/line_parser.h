/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: line_parser.h
 * Description: Parses a raw logcat line of a known wire format into a canonical
 *              LogRecord. Resolves timestamps to ISO-8601: epoch seconds are
 *              converted to UTC, month/day timestamps are completed with a
 *              reference year (the current calendar year by default).
 */

#pragma once

#include "lcsee/record/log_format.h"
#include "log_record.pb.h"
#include <optional>
#include <string>

namespace lcsee {
namespace parse {

// Parse `line` as `format` using the current calendar year for month/day
// formats. Returns nullopt when the line does not fully match the grammar or
// carries an impossible date, time or id; callers skip such lines.
//
// Lines dated in a different year than the parse (a log spanning New Year)
// are normalized into the current year.
std::optional<LogRecord> parse_line(const std::string& line, record::LogFormat format);

// Same as above with an explicit year for month/day formats
std::optional<LogRecord> parse_line(const std::string& line, record::LogFormat format,
                                    int reference_year);

// Current calendar year in local time
int current_year();

// "1700000000.123456" -> "2023-11-14T22:13:20.123456" (UTC, microseconds,
// seventh fractional digit rounds half up)
std::optional<std::string> epoch_to_iso(const std::string& epoch_text);

// (2024, "02-29", "13:05:09.12") -> "2024-02-29T13:05:09.120000".
// Fractions beyond microseconds are truncated.
std::optional<std::string> date_time_to_iso(int year, const std::string& date,
                                            const std::string& time);

} // namespace parse
} // namespace lcsee
