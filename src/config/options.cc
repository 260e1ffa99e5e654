/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: options.cc
 * Description: Validation of run options: exactly one input mode, formats
 *              allowed for that mode, and sane numeric values.
 */

#include "lcsee/config/options.h"
#include "lcsee/record/log_format.h"

namespace lcsee {
namespace config {

void validate_options(const Options& options) {
    const auto& source = options.source;

    if (source.mode == SourceMode::None) {
        throw ConfigError("One of --adb or --input is required");
    }

    const bool is_auto = source.format == "auto";
    if (!is_auto && !record::format_from_name(source.format)) {
        throw ConfigError("Unknown format '" + source.format +
                          "' (expected threadtime, time, epoch or auto)");
    }

    if (source.mode == SourceMode::Adb) {
        if (is_auto) {
            throw ConfigError("Format 'auto' is only available for file input");
        }
        if (source.follow) {
            throw ConfigError("--follow is only available for file input");
        }
        if (source.buffer.empty()) {
            throw ConfigError("Log buffer name must not be empty");
        }
    } else {
        if (source.input_path.empty()) {
            throw ConfigError("Input file path must not be empty");
        }
        if (source.poll_interval_ms <= 0) {
            throw ConfigError("Poll interval must be a positive number of milliseconds");
        }
    }

    if (options.output.json_indent && *options.output.json_indent < 0) {
        throw ConfigError("JSON indent must not be negative");
    }
}

} // namespace config
} // namespace lcsee
