/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: pipeline.h
 * Description: Header for Pipeline class that drives raw log lines through
 *              format detection, parsing, filtering and sink fan-out. Owns the
 *              termination logic: sinks are closed on end of input, on
 *              interruption and on errors.
 */

#pragma once

#include "lcsee/filter/filter_chain.h"
#include "lcsee/record/log_format.h"
#include "lcsee/sinks/sink.h"
#include "lcsee/sinks/sink_fanout.h"
#include "lcsee/source/line_source.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace lcsee {
namespace processor {

// Main processing pipeline
class Pipeline {
public:
    struct Config {
        record::LogFormat format = record::LogFormat::Threadtime;
        bool auto_detect = false;           // detect format from the first known line
        bool verbose = false;               // log run summary to stderr
        std::optional<int> reference_year;  // default: current year per line
    };

    struct RunStats {
        int64_t lines_read = 0;
        int64_t records_parsed = 0;
        int64_t records_skipped = 0;    // lines matching no grammar
        int64_t records_emitted = 0;    // records accepted by the filters
        int64_t sink_failures = 0;
        bool interrupted = false;
    };

    explicit Pipeline(const Config& config);

    void set_filter(filter::FilterChain filter);

    // Add sink; delivery follows registration order
    void add_sink(std::shared_ptr<sinks::Sink> sink);

    // Parse, filter and fan out one line. Returns true if it was emitted.
    bool process_line(const std::string& line);

    // Pull lines until the source ends or `running` is cleared, then close
    // all sinks. Sinks are closed before any exception propagates.
    // Throws parse::FormatDetectionError when auto-detection finds nothing.
    RunStats run(source::LineSource& source, const std::atomic<bool>& running);

    // Best-effort close of every sink; idempotent
    void close_sinks();

    record::LogFormat format() const { return format_; }
    const RunStats& stats() const { return stats_; }

private:
    Config config_;
    record::LogFormat format_;
    filter::FilterChain filter_;
    sinks::SinkFanout fanout_;
    RunStats stats_;

    void pump(source::LineSource& source, const std::atomic<bool>& running);
    void log_summary() const;
};

} // namespace processor
} // namespace lcsee
