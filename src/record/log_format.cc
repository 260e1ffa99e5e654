/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: log_format.cc
 * Description: Name conversions for the LogFormat enumeration.
 */

#include "lcsee/record/log_format.h"

namespace lcsee {
namespace record {

std::string format_name(LogFormat format) {
    switch (format) {
        case LogFormat::Threadtime: return "threadtime";
        case LogFormat::Time: return "time";
        case LogFormat::Epoch: return "epoch";
        case LogFormat::Unknown: break;
    }
    return "unknown";
}

std::optional<LogFormat> format_from_name(const std::string& name) {
    if (name == "threadtime") return LogFormat::Threadtime;
    if (name == "time") return LogFormat::Time;
    if (name == "epoch") return LogFormat::Epoch;
    return std::nullopt;
}

} // namespace record
} // namespace lcsee
