/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: log_format.h
 * Description: Closed set of logcat wire formats (threadtime, time, epoch)
 *              plus Unknown, with name conversions used by configuration and
 *              the device reader argument template.
 */

#pragma once

#include <optional>
#include <string>

namespace lcsee {
namespace record {

enum class LogFormat {
    Threadtime,
    Time,
    Epoch,
    Unknown
};

// "threadtime", "time", "epoch", "unknown"
std::string format_name(LogFormat format);

// Accepts the three known format names only
std::optional<LogFormat> format_from_name(const std::string& name);

} // namespace record
} // namespace lcsee
