/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: console_sink.cc
 * Description: Implementation of ConsoleSink. Writes one line per record to
 *              the given stream; coloring wraps the level letter only, so the
 *              text is identical with and without color.
 */

#include "lcsee/sinks/console_sink.h"

namespace lcsee {
namespace sinks {

namespace {
    constexpr const char* RESET = "\033[0m";
}

const char* level_color(const std::string& level) {
    if (level == "V") return "\033[2m";
    if (level == "I") return "\033[32m";
    if (level == "W") return "\033[33m";
    if (level == "E") return "\033[31m";
    if (level == "F") return "\033[1;31m";
    return "";
}

ConsoleSink::ConsoleSink(std::ostream& out, bool use_color)
    : out_(out), use_color_(use_color) {}

static std::string time_of_day(const std::string& ts_iso) {
    size_t t = ts_iso.find('T');
    return t == std::string::npos ? ts_iso : ts_iso.substr(t + 1);
}

static std::string id_or_dash(bool present, int32_t value) {
    return present ? std::to_string(value) : "-";
}

static std::string prefix(const LogRecord& record) {
    return time_of_day(record.ts_iso()) + " " +
           id_or_dash(record.has_pid(), record.pid()) + "/" +
           id_or_dash(record.has_tid(), record.tid()) + " ";
}

std::string ConsoleSink::format_line(const LogRecord& record) {
    return prefix(record) + record.level() + " " + record.tag() + ": " + record.msg();
}

bool ConsoleSink::emit(const LogRecord& record) {
    const char* color = use_color_ ? level_color(record.level()) : "";
    if (*color == '\0') {
        out_ << format_line(record) << "\n";
    } else {
        out_ << prefix(record) << color << record.level() << RESET
             << " " << record.tag() << ": " << record.msg() << "\n";
    }
    return static_cast<bool>(out_);
}

void ConsoleSink::flush() {
    out_.flush();
}

void ConsoleSink::close() {
    out_.flush();
}

} // namespace sinks
} // namespace lcsee
