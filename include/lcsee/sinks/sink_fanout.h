/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink_fanout.h
 * Description: Header for SinkFanout, the ordered set of sinks every accepted
 *              record is delivered to. Failures of one sink never stop delivery
 *              to, or closing of, the others.
 */

#pragma once

#include "lcsee/sinks/sink.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace lcsee {
namespace sinks {

class SinkFanout {
public:
    void add(std::shared_ptr<Sink> sink);

    // Deliver to every sink in registration order. Returns the number of
    // sinks that failed; failures are logged and never propagated.
    size_t emit(const LogRecord& record);

    // Best-effort flush and close of every sink; later calls do nothing
    void close_all();

    size_t size() const { return sinks_.size(); }
    bool closed() const { return closed_; }
    int64_t failures() const { return failures_; }

private:
    std::vector<std::shared_ptr<Sink>> sinks_;
    bool closed_ = false;
    int64_t failures_ = 0;
};

} // namespace sinks
} // namespace lcsee
