/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: builder.h
 * Description: Builds the pipeline pieces (line source, sinks, filter chain,
 *              pipeline configuration) from validated run options.
 */

#pragma once

#include "lcsee/config/options.h"
#include "lcsee/processor/pipeline.h"
#include "lcsee/source/line_source.h"
#include <iostream>
#include <memory>

namespace lcsee {
namespace processor {

// Launches the reader or opens the file; throws source::SourceError
std::unique_ptr<source::LineSource> make_source(const config::SourceOptions& options);

Pipeline::Config make_pipeline_config(const config::Options& options);

// File sinks first (JSON, then CSV), then the console when enabled.
// Throws sinks::SinkError when an output file cannot be opened.
void attach_sinks(Pipeline& pipeline, const config::OutputOptions& options,
                  std::ostream& console = std::cout);

// Complete pipeline (config, filters, sinks) for `options`
std::unique_ptr<Pipeline> make_pipeline(const config::Options& options,
                                        std::ostream& console = std::cout);

// Source and pipeline for one run
struct Session {
    std::unique_ptr<source::LineSource> source;
    std::unique_ptr<Pipeline> pipeline;
};

// Opens the source first, so a source error leaves output files untouched
Session make_session(const config::Options& options, std::ostream& console = std::cout);

} // namespace processor
} // namespace lcsee
