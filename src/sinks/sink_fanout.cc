/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink_fanout.cc
 * Description: Implementation of SinkFanout with per-sink failure isolation.
 */

#include "lcsee/sinks/sink_fanout.h"
#include <iostream>

namespace lcsee {
namespace sinks {

void SinkFanout::add(std::shared_ptr<Sink> sink) {
    sinks_.push_back(sink);
}

size_t SinkFanout::emit(const LogRecord& record) {
    size_t failed = 0;
    for (auto& sink : sinks_) {
        try {
            if (!sink->emit(record)) {
                std::cerr << "Failed to write record to " << sink->name() << std::endl;
                ++failed;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error writing record to " << sink->name() << ": " << e.what() << std::endl;
            ++failed;
        }
    }
    failures_ += static_cast<int64_t>(failed);
    return failed;
}

void SinkFanout::close_all() {
    if (closed_) {
        return;
    }
    closed_ = true;
    for (auto& sink : sinks_) {
        try {
            sink->flush();
        } catch (const std::exception& e) {
            std::cerr << "Error flushing " << sink->name() << ": " << e.what() << std::endl;
            ++failures_;
        }
        // Close even when flush failed
        try {
            sink->close();
        } catch (const std::exception& e) {
            std::cerr << "Error closing " << sink->name() << ": " << e.what() << std::endl;
            ++failures_;
        }
    }
}

} // namespace sinks
} // namespace lcsee
