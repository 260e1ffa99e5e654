/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: grammar.cc
 * Description: Compiled header patterns for the threadtime, time and epoch
 *              logcat formats. The regex covers the fixed prefix up to the
 *              level letter; the tag and message are split off by hand.
 */

#include "lcsee/parse/grammar.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace lcsee {
namespace parse {

namespace {

// libstdc++ matches with one stack frame per character, so the regex only
// ever sees this many leading bytes. Longer prefixes do not match.
constexpr size_t PREFIX_WINDOW = 512;

// Prefix patterns, each ending with the level letter and one whitespace
const std::regex& threadtime_prefix() {
    static const std::regex re(
        R"(((\d\d-\d\d)\s+(\d\d:\d\d:\d\d\.\d+))\s+(\d+)\s+(\d+)\s+([VDIWEF])\s)");
    return re;
}

const std::regex& time_prefix() {
    static const std::regex re(
        R"(((\d\d-\d\d)\s+(\d\d:\d\d:\d\d\.\d+))\s+([VDIWEF])\s)");
    return re;
}

const std::regex& epoch_prefix() {
    static const std::regex re(
        R"((\d+\.\d+)\s+(\d+)\s+(\d+)\s+([VDIWEF])\s)");
    return re;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "<tag>:<whitespace><msg>" starting at `pos`. The tag runs to the first
// colon and is non-empty; at least one whitespace must follow the colon.
bool split_tag_message(const std::string& line, size_t pos, LineFields& fields) {
    size_t colon = line.find(':', pos);
    if (colon == std::string::npos || colon == pos) {
        return false;
    }
    size_t text = colon + 1;
    if (text >= line.size() || !is_space(line[text])) {
        return false;
    }
    while (text < line.size() && is_space(line[text])) {
        ++text;
    }
    fields.tag = line.substr(pos, colon - pos);
    fields.msg = line.substr(text);
    return true;
}

// '.' in a line pattern never spans a line break
bool valid_message(const std::string& msg) {
    return msg.find_first_of("\r\n") == std::string::npos;
}

} // namespace

std::optional<LineFields> match_grammar(const std::string& line, record::LogFormat format) {
    const auto window_end = line.begin() +
        static_cast<std::ptrdiff_t>(std::min(line.size(), PREFIX_WINDOW));
    const auto flags = std::regex_constants::match_continuous;
    std::smatch m;
    LineFields fields;

    switch (format) {
        case record::LogFormat::Threadtime:
            if (!std::regex_search(line.begin(), window_end, m, threadtime_prefix(), flags)) {
                return std::nullopt;
            }
            fields.ts_raw = m[1].str();
            fields.date = m[2].str();
            fields.time = m[3].str();
            fields.pid = m[4].str();
            fields.tid = m[5].str();
            fields.level = m[6].str()[0];
            break;
        case record::LogFormat::Time:
            if (!std::regex_search(line.begin(), window_end, m, time_prefix(), flags)) {
                return std::nullopt;
            }
            fields.ts_raw = m[1].str();
            fields.date = m[2].str();
            fields.time = m[3].str();
            fields.level = m[4].str()[0];
            break;
        case record::LogFormat::Epoch:
            if (!std::regex_search(line.begin(), window_end, m, epoch_prefix(), flags)) {
                return std::nullopt;
            }
            fields.ts_raw = m[1].str();
            fields.epoch = m[1].str();
            fields.pid = m[2].str();
            fields.tid = m[3].str();
            fields.level = m[4].str()[0];
            break;
        case record::LogFormat::Unknown:
            return std::nullopt;
    }

    if (!split_tag_message(line, static_cast<size_t>(m.length(0)), fields)) {
        return std::nullopt;
    }
    if (!valid_message(fields.msg)) {
        return std::nullopt;
    }
    return fields;
}

} // namespace parse
} // namespace lcsee
