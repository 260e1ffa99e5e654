/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: options.h
 * Description: Run options for the lcsee pipeline: input source (device log
 *              reader or file), record filters and output sinks. Filled from
 *              a YAML configuration file and the command line, then validated
 *              before the pipeline is built.
 */

#pragma once

#include "lcsee/record/level.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lcsee {
namespace config {

// Invalid or contradictory options
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SourceMode {
    None,
    Adb,
    File
};

struct SourceOptions {
    SourceMode mode = SourceMode::None;

    // Adb mode
    std::string serial;
    std::string adb_path = "adb";
    std::string buffer = "main";
    bool clear = false;

    // threadtime, time, epoch; "auto" in file mode only
    std::string format = "threadtime";

    // File mode
    std::string input_path;
    bool follow = false;
    int64_t poll_interval_ms = 200;
};

struct FilterOptions {
    std::optional<record::Level> min_level;
    std::vector<std::string> tags;
    std::optional<std::string> grep;
    std::optional<std::string> contains;
    bool ignore_case = false;
    std::optional<int32_t> pid;
};

struct OutputOptions {
    bool color = true;
    bool console = false;            // console next to file sinks
    std::string json_path;
    std::optional<int> json_indent;
    std::string csv_path;

    // Console is the fallback when no file sink is configured
    bool console_enabled() const {
        return console || (json_path.empty() && csv_path.empty());
    }
};

struct Options {
    SourceOptions source;
    FilterOptions filters;
    OutputOptions output;
    bool verbose = false;
};

// Throws ConfigError describing the first problem found
void validate_options(const Options& options);

} // namespace config
} // namespace lcsee
