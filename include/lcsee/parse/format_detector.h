/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: format_detector.h
 * Description: Wire format detection. Classifies a single line as threadtime,
 *              time, epoch or unknown, and probes a line source until the first
 *              recognizable line for file auto-detection.
 */

#pragma once

#include "lcsee/record/log_format.h"
#include "lcsee/source/line_source.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace lcsee {
namespace parse {

// Raised when auto-detection exhausts its source without a known format
class FormatDetectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Tries threadtime, time, epoch in that order; first full match wins.
record::LogFormat detect_format(const std::string& line);

// Pull lines from `source` until one has a known format. Every pulled line,
// the detected one included, is appended to `probed` so the caller can replay
// them. Returns Unknown when the source ends first.
record::LogFormat detect_stream_format(source::LineSource& source,
                                       std::vector<std::string>& probed);

} // namespace parse
} // namespace lcsee
