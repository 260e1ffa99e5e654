/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: format_detector.cc
 * Description: Implementation of logcat wire format detection over single lines
 *              and over the head of a line source.
 */

#include "lcsee/parse/format_detector.h"
#include "lcsee/parse/grammar.h"

namespace lcsee {
namespace parse {

using record::LogFormat;

LogFormat detect_format(const std::string& line) {
    static const LogFormat priority[] = {
        LogFormat::Threadtime,
        LogFormat::Time,
        LogFormat::Epoch
    };
    for (LogFormat format : priority) {
        if (match_grammar(line, format)) {
            return format;
        }
    }
    return LogFormat::Unknown;
}

LogFormat detect_stream_format(source::LineSource& source,
                               std::vector<std::string>& probed) {
    while (auto line = source.next()) {
        probed.push_back(*line);
        LogFormat format = detect_format(*line);
        if (format != LogFormat::Unknown) {
            return format;
        }
    }
    return LogFormat::Unknown;
}

} // namespace parse
} // namespace lcsee
