/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: grammar.h
 * Description: Field grammars of the three logcat wire formats. Matches a raw
 *              line against one grammar and returns the raw text of each field
 *              without any conversion. Shared by the format detector and the
 *              line parser.
 */

#pragma once

#include "lcsee/record/log_format.h"
#include <optional>
#include <string>

namespace lcsee {
namespace parse {

// Raw field text of a line that fully matched a grammar
struct LineFields {
    std::string ts_raw;  // timestamp span exactly as in the line
    std::string date;    // MM-DD (threadtime, time)
    std::string time;    // HH:MM:SS.frac (threadtime, time)
    std::string epoch;   // secs.frac (epoch)
    std::string pid;     // empty for time
    std::string tid;     // empty for time
    char level = '\0';
    std::string tag;     // untrimmed
    std::string msg;
};

// Full-line match of `line` against the grammar of `format`.
// Returns nullopt on any mismatch, and always for LogFormat::Unknown.
std::optional<LineFields> match_grammar(const std::string& line, record::LogFormat format);

} // namespace parse
} // namespace lcsee
