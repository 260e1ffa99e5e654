/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: pipeline.cc
 * Description: Implementation of the Pipeline class. Pulls one line at a time
 *              and pushes it synchronously through parse, filter and fan-out.
 *              In auto mode the lines pulled while probing for the format are
 *              replayed so that none is lost.
 */

#include "lcsee/processor/pipeline.h"
#include "lcsee/parse/format_detector.h"
#include "lcsee/parse/line_parser.h"
#include "lcsee/source/replay_line_source.h"
#include <iostream>
#include <vector>

namespace lcsee {
namespace processor {

using record::LogFormat;

Pipeline::Pipeline(const Config& config) : config_(config), format_(config.format) {}

void Pipeline::set_filter(filter::FilterChain filter) {
    filter_ = std::move(filter);
}

void Pipeline::add_sink(std::shared_ptr<sinks::Sink> sink) {
    fanout_.add(sink);
}

bool Pipeline::process_line(const std::string& line) {
    ++stats_.lines_read;

    auto record = config_.reference_year
        ? parse::parse_line(line, format_, *config_.reference_year)
        : parse::parse_line(line, format_);
    if (!record) {
        ++stats_.records_skipped;
        return false;
    }
    ++stats_.records_parsed;

    if (!filter_.accepts(*record)) {
        return false;
    }

    stats_.sink_failures += static_cast<int64_t>(fanout_.emit(*record));
    ++stats_.records_emitted;
    return true;
}

void Pipeline::pump(source::LineSource& source, const std::atomic<bool>& running) {
    while (running.load()) {
        auto line = source.next();
        if (!line) {
            break;
        }
        process_line(*line);
    }
}

Pipeline::RunStats Pipeline::run(source::LineSource& source, const std::atomic<bool>& running) {
    source.set_stop_flag(&running);

    try {
        if (config_.auto_detect) {
            std::vector<std::string> probed;
            LogFormat detected = parse::detect_stream_format(source, probed);
            if (detected == LogFormat::Unknown) {
                if (running.load()) {
                    throw parse::FormatDetectionError("Could not determine the log format of the input");
                }
            } else {
                format_ = detected;
                if (config_.verbose) {
                    std::cerr << "Detected format: " << record::format_name(format_) << std::endl;
                }
                source::ReplayLineSource replay(std::move(probed), source);
                pump(replay, running);
            }
        } else {
            pump(source, running);
        }
    } catch (...) {
        close_sinks();
        throw;
    }

    stats_.interrupted = !running.load();
    close_sinks();
    if (config_.verbose) {
        log_summary();
    }
    return stats_;
}

void Pipeline::close_sinks() {
    int64_t before = fanout_.failures();
    fanout_.close_all();
    stats_.sink_failures += fanout_.failures() - before;
}

void Pipeline::log_summary() const {
    std::cerr << "Lines read: " << stats_.lines_read
              << ", parsed: " << stats_.records_parsed
              << ", skipped: " << stats_.records_skipped
              << ", emitted: " << stats_.records_emitted;
    if (stats_.sink_failures > 0) {
        std::cerr << ", sink failures: " << stats_.sink_failures;
    }
    if (stats_.interrupted) {
        std::cerr << " (interrupted)";
    }
    std::cerr << std::endl;
}

} // namespace processor
} // namespace lcsee
