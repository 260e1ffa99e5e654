/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: builder.cc
 * Description: Implementation of the pipeline builders.
 */

#include "lcsee/processor/builder.h"
#include "lcsee/sinks/console_sink.h"
#include "lcsee/sinks/csv_sink.h"
#include "lcsee/sinks/jsonl_sink.h"
#include "lcsee/source/file_line_source.h"
#include "lcsee/source/process_line_source.h"
#include <chrono>

namespace lcsee {
namespace processor {

std::unique_ptr<source::LineSource> make_source(const config::SourceOptions& options) {
    if (options.mode == config::SourceMode::Adb) {
        source::ProcessLineSource::Config cfg;
        cfg.adb_path = options.adb_path;
        cfg.serial = options.serial;
        cfg.buffer = options.buffer;
        cfg.format = options.format;
        cfg.clear = options.clear;
        return std::make_unique<source::ProcessLineSource>(cfg);
    }

    source::FileLineSource::Config cfg;
    cfg.path = options.input_path;
    cfg.follow = options.follow;
    cfg.poll_interval = std::chrono::milliseconds(options.poll_interval_ms);
    return std::make_unique<source::FileLineSource>(cfg);
}

Pipeline::Config make_pipeline_config(const config::Options& options) {
    Pipeline::Config cfg;
    cfg.verbose = options.verbose;
    if (options.source.format == "auto") {
        cfg.auto_detect = true;
    } else {
        auto format = record::format_from_name(options.source.format);
        if (!format) {
            throw config::ConfigError("Unknown format '" + options.source.format + "'");
        }
        cfg.format = *format;
    }
    return cfg;
}

void attach_sinks(Pipeline& pipeline, const config::OutputOptions& options,
                  std::ostream& console) {
    if (!options.json_path.empty()) {
        pipeline.add_sink(std::make_shared<sinks::JSONLSink>(options.json_path, options.json_indent));
    }
    if (!options.csv_path.empty()) {
        pipeline.add_sink(std::make_shared<sinks::CSVSink>(options.csv_path));
    }
    if (options.console_enabled()) {
        pipeline.add_sink(std::make_shared<sinks::ConsoleSink>(console, options.color));
    }
}

std::unique_ptr<Pipeline> make_pipeline(const config::Options& options, std::ostream& console) {
    auto pipeline = std::make_unique<Pipeline>(make_pipeline_config(options));
    pipeline->set_filter(filter::FilterChain::from_options(options.filters));
    attach_sinks(*pipeline, options.output, console);
    return pipeline;
}

Session make_session(const config::Options& options, std::ostream& console) {
    Session session;
    session.source = make_source(options.source);
    session.pipeline = make_pipeline(options, console);
    return session;
}

} // namespace processor
} // namespace lcsee
